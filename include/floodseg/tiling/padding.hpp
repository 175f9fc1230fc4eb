#pragma once

#include "floodseg/core/types.hpp"

#include <vector>

namespace floodseg::tiling {

// Right/bottom padding needed to reach target_size on each axis. Axes already
// at or above target_size get zero padding.
struct PadExtent {
    int original_width = 0;
    int original_height = 0;
    int pad_right = 0;
    int pad_bottom = 0;

    bool empty() const { return pad_right == 0 && pad_bottom == 0; }
};

PadExtent compute_pad_extent(int width, int height, int target_size);

// Mirror padding about the last row/column (no edge repetition), applied only
// along axes shorter than target_size. Never crops.
Matrix2Df pad_reflect(const Matrix2Df& array, int target_size);

// Same padding applied to every channel; all channels must share one size.
std::vector<Matrix2Df> pad_reflect(const std::vector<Matrix2Df>& channels, int target_size);

// Inverse of pad_reflect: top-left original_height x original_width block.
Matrix2Df crop_padding(const Matrix2Df& padded, const PadExtent& extent);

} // namespace floodseg::tiling
