#include "floodseg/training/training_state.hpp"
#include "floodseg/core/errors.hpp"

#include <algorithm>
#include <cmath>

namespace floodseg::training {

bool update_training_state(TrainingState& state, double val_loss, const PlateauSchedule& schedule) {
    if (!(schedule.decay_factor > 0.0 && schedule.decay_factor < 1.0)) {
        throw ConfigurationError("decay_factor must be in (0, 1)");
    }
    if (schedule.patience < 1 || schedule.max_decays < 0 || schedule.min_delta < 0.0) {
        throw ConfigurationError("invalid plateau schedule");
    }

    ++state.epoch;
    if (state.stop) {
        return false;
    }

    if (std::isfinite(val_loss) && val_loss < state.best_val_loss - schedule.min_delta) {
        state.best_val_loss = val_loss;
        state.epochs_since_improvement = 0;
        return true;
    }

    ++state.epochs_since_improvement;
    if (state.epochs_since_improvement >= schedule.patience) {
        if (state.lr_decays >= schedule.max_decays || state.learning_rate <= schedule.min_lr) {
            state.stop = true;
        } else {
            state.learning_rate =
                std::max(schedule.min_lr, state.learning_rate * schedule.decay_factor);
            ++state.lr_decays;
            state.epochs_since_improvement = 0;
        }
    }
    return false;
}

} // namespace floodseg::training
