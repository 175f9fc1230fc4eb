#include "floodseg/metrics/mask_stats.hpp"

#include <cmath>

namespace floodseg::metrics {

MaskStats compute_mask_stats(const Matrix2Df& mask, const GeoTransform& transform) {
    MaskStats s;
    s.total_pixels = static_cast<std::size_t>(mask.size());
    s.water_pixels = static_cast<std::size_t>((mask.array() > 0.5f).count());
    s.water_fraction = s.total_pixels > 0
                           ? static_cast<double>(s.water_pixels) / static_cast<double>(s.total_pixels)
                           : 0.0;
    s.pixel_area = std::abs(transform[1] * transform[5] - transform[2] * transform[4]);
    s.water_area = s.pixel_area * static_cast<double>(s.water_pixels);
    return s;
}

} // namespace floodseg::metrics
