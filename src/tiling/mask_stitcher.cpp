#include "floodseg/tiling/mask_stitcher.hpp"
#include "floodseg/core/errors.hpp"

#include <algorithm>
#include <string>

namespace floodseg::tiling {

MaskStitcher::MaskStitcher(const TilePlan& plan, StitchPolicy policy)
    : plan_(plan),
      policy_(policy),
      canvas_(Matrix2Df::Zero(plan.image_height, plan.image_width)),
      coverage_(Matrix2Df::Zero(plan.image_height, plan.image_width)) {}

void MaskStitcher::add(int tile_index, const Matrix2Df& prediction) {
    if (tile_index < 0 || static_cast<std::size_t>(tile_index) != next_) {
        throw PipelineError("tile " + std::to_string(tile_index) +
                            " stitched out of plan order (expected " +
                            std::to_string(next_) + ")");
    }
    if (next_ >= plan_.windows.size()) {
        throw ShapeError("plan has only " + std::to_string(plan_.windows.size()) + " windows");
    }

    const Window& w = plan_.windows[next_];
    if (prediction.cols() < w.width || prediction.rows() < w.height) {
        throw ShapeError("prediction for tile " + std::to_string(tile_index) + " is " +
                         std::to_string(prediction.cols()) + "x" +
                         std::to_string(prediction.rows()) + ", window needs " +
                         std::to_string(w.width) + "x" + std::to_string(w.height));
    }

    for (int ly = 0; ly < w.height; ++ly) {
        const int y = w.y_off + ly;
        for (int lx = 0; lx < w.width; ++lx) {
            const int x = w.x_off + lx;
            const float v = prediction(ly, lx);
            switch (policy_) {
                case StitchPolicy::LAST_WRITE:
                    canvas_(y, x) = v;
                    break;
                case StitchPolicy::MEAN:
                    canvas_(y, x) += v;
                    break;
                case StitchPolicy::MAX_CONFIDENCE:
                    canvas_(y, x) = coverage_(y, x) > 0.0f ? std::max(canvas_(y, x), v) : v;
                    break;
            }
            coverage_(y, x) += 1.0f;
        }
    }

    ++next_;
}

Matrix2Df MaskStitcher::result() const {
    if (!complete()) {
        throw PipelineError("stitching incomplete: " + std::to_string(next_) + " of " +
                            std::to_string(plan_.windows.size()) + " tiles added");
    }

    if (policy_ != StitchPolicy::MEAN) {
        return canvas_;
    }

    Matrix2Df out = canvas_;
    for (Eigen::Index i = 0; i < out.size(); ++i) {
        if (coverage_.data()[i] > 0.0f) {
            out.data()[i] /= coverage_.data()[i];
        }
    }
    return out;
}

Matrix2Df stitch_masks(const TilePlan& plan, const std::vector<Matrix2Df>& predictions,
                       int image_width, int image_height, StitchPolicy policy) {
    if (plan.image_width != image_width || plan.image_height != image_height) {
        throw ShapeError("plan covers " + std::to_string(plan.image_width) + "x" +
                         std::to_string(plan.image_height) + " but output is " +
                         std::to_string(image_width) + "x" + std::to_string(image_height));
    }
    if (predictions.size() != plan.windows.size()) {
        throw ShapeError("got " + std::to_string(predictions.size()) + " predictions for " +
                         std::to_string(plan.windows.size()) + " windows");
    }

    MaskStitcher stitcher(plan, policy);
    for (size_t i = 0; i < predictions.size(); ++i) {
        stitcher.add(static_cast<int>(i), predictions[i]);
    }
    return stitcher.result();
}

Matrix2Df threshold_mask(const Matrix2Df& confidence, float threshold) {
    return (confidence.array() >= threshold).cast<float>().matrix();
}

} // namespace floodseg::tiling
