#pragma once

#include "floodseg/core/types.hpp"

#include <cstddef>
#include <vector>

namespace floodseg::tiling {

/**
 * Reassembles per-tile predictions into one full-resolution confidence canvas.
 *
 * Predictions are placed at their window offsets in plan order. A prediction
 * may still carry right/bottom padding; only its top-left window-sized block
 * is used. Overlapping pixels are resolved by the policy:
 *   LAST_WRITE      later tile in plan order wins
 *   MEAN            average of all covering tiles
 *   MAX_CONFIDENCE  maximum of all covering tiles
 */
class MaskStitcher {
public:
    explicit MaskStitcher(const TilePlan& plan, StitchPolicy policy = StitchPolicy::LAST_WRITE);

    // tile_index must equal the number of tiles already added.
    void add(int tile_index, const Matrix2Df& prediction);

    std::size_t tiles_added() const { return next_; }
    bool complete() const { return next_ == plan_.windows.size(); }

    // Throws PipelineError until every window has a prediction.
    Matrix2Df result() const;

private:
    TilePlan plan_;
    StitchPolicy policy_;
    Matrix2Df canvas_;
    Matrix2Df coverage_;
    std::size_t next_ = 0;
};

Matrix2Df stitch_masks(const TilePlan& plan, const std::vector<Matrix2Df>& predictions,
                       int image_width, int image_height,
                       StitchPolicy policy = StitchPolicy::LAST_WRITE);

// 1 where confidence >= threshold, else 0.
Matrix2Df threshold_mask(const Matrix2Df& confidence, float threshold);

} // namespace floodseg::tiling
