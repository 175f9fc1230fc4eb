#include "floodseg/pipeline/tile_consumer.hpp"
#include "floodseg/core/errors.hpp"
#include "floodseg/tiling/tile_extractor.hpp"

namespace floodseg::pipeline {

void run_tile_plan(const io::RasterSource& source, const TilePlan& plan,
                   const std::string& image_id, TileConsumer& consumer,
                   const ProgressCallback& progress) {
    if (plan.image_width != source.width() || plan.image_height != source.height()) {
        throw IOError("plan for " + std::to_string(plan.image_width) + "x" +
                      std::to_string(plan.image_height) + " does not match raster " +
                      std::to_string(source.width()) + "x" + std::to_string(source.height()) +
                      ": " + source.path().string());
    }

    const std::size_t total = plan.windows.size();
    for (std::size_t i = 0; i < total; ++i) {
        const Window& window = plan.windows[i];
        Tile tile = tiling::extract_tile(source, window, static_cast<int>(i), image_id);
        consumer.consume(tile, window);
        if (progress) progress(i + 1, total);
    }
}

} // namespace floodseg::pipeline
