#pragma once

#include "floodseg/core/types.hpp"

#include <string>

namespace floodseg::tiling {

// "tile_{image_id}_{tile_index}.tif"; tile_index is the plan position.
std::string tile_filename(const std::string& image_id, int tile_index);

// Source profile with width, height and transform replaced by the tile's.
// Band count, sample type, CRS and nodata are kept.
RasterProfile derive_tile_profile(const RasterProfile& source, const Tile& tile);

// Persists `tile` as an independently openable GeoTIFF. Overwrites `output_path`.
void write_tile(const Tile& tile, const RasterProfile& source_profile,
                const fs::path& output_path, const std::string& compress = "");

} // namespace floodseg::tiling
