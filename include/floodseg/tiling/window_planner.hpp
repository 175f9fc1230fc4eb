#pragma once

#include "floodseg/core/types.hpp"

namespace floodseg::tiling {

// Intersection of `nominal` with the image rectangle [0,W) x [0,H).
Window clip_window(const Window& nominal, int image_width, int image_height);

// Row-major windows at multiples of step = tile_size - overlap, clipped to the
// image. Throws ConfigurationError unless W, H, tile_size > 0 and
// 0 <= overlap < tile_size.
TilePlan plan_windows(int image_width, int image_height, int tile_size, int overlap);

} // namespace floodseg::tiling
