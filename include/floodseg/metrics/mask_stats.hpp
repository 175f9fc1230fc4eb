#pragma once

#include "floodseg/core/types.hpp"

#include <cstddef>

namespace floodseg::metrics {

struct MaskStats {
    std::size_t water_pixels = 0;
    std::size_t total_pixels = 0;
    double water_fraction = 0.0;
    double pixel_area = 0.0;  // CRS units squared
    double water_area = 0.0;
};

// Counts mask pixels > 0.5 as water. Pixel area is |t1*t5 - t2*t4|.
MaskStats compute_mask_stats(const Matrix2Df& mask, const GeoTransform& transform);

} // namespace floodseg::metrics
