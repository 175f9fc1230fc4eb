#pragma once

#include "floodseg/core/types.hpp"
#include "floodseg/io/geotiff_io.hpp"

#include <cstddef>
#include <functional>
#include <string>

namespace floodseg::pipeline {

// Receives each extracted tile of a plan. Dataset preparation and inference
// differ only in the consumer they pass to run_tile_plan.
class TileConsumer {
public:
    virtual ~TileConsumer() = default;
    virtual void consume(const Tile& tile, const Window& window) = 0;
};

using ProgressCallback = std::function<void(std::size_t done, std::size_t total)>;

// Extracts every window of `plan` from `source` in plan order and hands it to
// `consumer`. The plan must have been built for the source's dimensions.
void run_tile_plan(const io::RasterSource& source, const TilePlan& plan,
                   const std::string& image_id, TileConsumer& consumer,
                   const ProgressCallback& progress = nullptr);

} // namespace floodseg::pipeline
