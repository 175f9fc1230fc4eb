#pragma once

#include <limits>

namespace floodseg::training {

// Learning-rate decay on validation-loss plateau, with early stop once the
// decay budget is spent.
struct PlateauSchedule {
    double decay_factor = 0.1;
    int patience = 5;          // epochs without improvement before a decay
    double min_delta = 1e-4;   // required loss decrease to count as improvement
    double min_lr = 1e-6;
    int max_decays = 3;        // stop after this many decays without improvement
};

struct TrainingState {
    int epoch = 0;
    double learning_rate = 1e-3;
    double best_val_loss = std::numeric_limits<double>::infinity();
    int epochs_since_improvement = 0;
    int lr_decays = 0;
    bool stop = false;
};

// Records one finished epoch. Returns true if val_loss is a new best (the
// caller should checkpoint). Throws ConfigurationError on an invalid schedule.
bool update_training_state(TrainingState& state, double val_loss, const PlateauSchedule& schedule);

} // namespace floodseg::training
