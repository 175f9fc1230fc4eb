#include "floodseg/tiling/tile_extractor.hpp"

namespace floodseg::tiling {

GeoTransform window_transform(const GeoTransform& source, const Window& window) {
    GeoTransform out = source;
    out[0] = source[0] + window.x_off * source[1] + window.y_off * source[2];
    out[3] = source[3] + window.x_off * source[4] + window.y_off * source[5];
    return out;
}

Tile extract_tile(const io::RasterSource& source, const Window& window,
                  int index, const std::string& image_id) {
    Tile tile;
    tile.index = index;
    tile.image_id = image_id;
    tile.window = window;
    tile.pixels = source.read_window(window);
    tile.transform = window_transform(source.profile().transform, window);
    return tile;
}

} // namespace floodseg::tiling
