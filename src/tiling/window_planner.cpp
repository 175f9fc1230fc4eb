#include "floodseg/tiling/window_planner.hpp"
#include "floodseg/core/errors.hpp"

#include <algorithm>
#include <string>

namespace floodseg::tiling {

Window clip_window(const Window& nominal, int image_width, int image_height) {
    int x0 = std::max(0, nominal.x_off);
    int y0 = std::max(0, nominal.y_off);
    int x1 = std::min(image_width, nominal.x_off + nominal.width);
    int y1 = std::min(image_height, nominal.y_off + nominal.height);

    return Window{x0, y0, std::max(0, x1 - x0), std::max(0, y1 - y0)};
}

TilePlan plan_windows(int image_width, int image_height, int tile_size, int overlap) {
    if (image_width <= 0 || image_height <= 0) {
        throw ConfigurationError("image size must be positive, got " +
                                 std::to_string(image_width) + "x" + std::to_string(image_height));
    }
    if (tile_size <= 0) {
        throw ConfigurationError("tile_size must be positive, got " + std::to_string(tile_size));
    }
    if (overlap < 0 || overlap >= tile_size) {
        throw ConfigurationError("overlap must be in [0, " + std::to_string(tile_size) +
                                 "), got " + std::to_string(overlap));
    }

    TilePlan plan;
    plan.image_width = image_width;
    plan.image_height = image_height;
    plan.tile_size = tile_size;
    plan.overlap = overlap;
    plan.step = tile_size - overlap;

    const int cols = (image_width + plan.step - 1) / plan.step;
    const int rows = (image_height + plan.step - 1) / plan.step;
    plan.windows.reserve(static_cast<size_t>(cols) * static_cast<size_t>(rows));

    for (int y = 0; y < image_height; y += plan.step) {
        for (int x = 0; x < image_width; x += plan.step) {
            plan.windows.push_back(
                clip_window(Window{x, y, tile_size, tile_size}, image_width, image_height));
        }
    }

    return plan;
}

} // namespace floodseg::tiling
