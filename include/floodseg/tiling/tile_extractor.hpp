#pragma once

#include "floodseg/core/types.hpp"
#include "floodseg/io/geotiff_io.hpp"

#include <string>

namespace floodseg::tiling {

// Translation-only composition of a raster transform with a window offset.
GeoTransform window_transform(const GeoTransform& source, const Window& window);

// Reads `window` from `source` (all bands, band order kept) and attaches the
// per-tile transform. Throws IOError if the window lies outside the source.
Tile extract_tile(const io::RasterSource& source, const Window& window,
                  int index, const std::string& image_id);

} // namespace floodseg::tiling
