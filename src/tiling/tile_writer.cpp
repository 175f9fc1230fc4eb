#include "floodseg/tiling/tile_writer.hpp"
#include "floodseg/core/errors.hpp"
#include "floodseg/io/geotiff_io.hpp"

namespace floodseg::tiling {

std::string tile_filename(const std::string& image_id, int tile_index) {
    return "tile_" + image_id + "_" + std::to_string(tile_index) + ".tif";
}

RasterProfile derive_tile_profile(const RasterProfile& source, const Tile& tile) {
    RasterProfile out = source;
    out.driver = kOutputDriver;
    out.width = tile.window.width;
    out.height = tile.window.height;
    out.transform = tile.transform;
    return out;
}

void write_tile(const Tile& tile, const RasterProfile& source_profile,
                const fs::path& output_path, const std::string& compress) {
    if (tile.pixels.channels() != source_profile.band_count) {
        throw ShapeError("tile " + std::to_string(tile.index) + " of '" + tile.image_id +
                         "' has " + std::to_string(tile.pixels.channels()) +
                         " channels, source has " + std::to_string(source_profile.band_count));
    }
    if (tile.pixels.width() != tile.window.width || tile.pixels.height() != tile.window.height) {
        throw ShapeError("tile " + std::to_string(tile.index) + " of '" + tile.image_id +
                         "' pixel block does not match its window");
    }

    io::write_raster(output_path, tile.pixels, derive_tile_profile(source_profile, tile), compress);
}

} // namespace floodseg::tiling
