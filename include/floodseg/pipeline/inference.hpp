#pragma once

#include "floodseg/core/types.hpp"
#include "floodseg/model/segmentation_model.hpp"
#include "floodseg/pipeline/tile_consumer.hpp"
#include "floodseg/tiling/mask_stitcher.hpp"

#include <cstddef>
#include <string>

namespace floodseg::pipeline {

// Pads each tile to the model's input size, predicts, crops the padding back
// off and hands the result to the stitcher.
class InferenceConsumer : public TileConsumer {
public:
    InferenceConsumer(const model::SegmentationModel& model, tiling::MaskStitcher& stitcher);

    void consume(const Tile& tile, const Window& window) override;

private:
    const model::SegmentationModel& model_;
    tiling::MaskStitcher& stitcher_;
};

struct InferenceOptions {
    int tile_size = 256;
    int overlap = 32;
    StitchPolicy policy = StitchPolicy::LAST_WRITE;
    float threshold = 0.5f;
};

struct InferenceResult {
    TilePlan plan;
    Matrix2Df confidence;
    Matrix2Df mask;         // 1 = water, 0 = background
    RasterProfile profile;  // source raster profile
    std::size_t tile_count = 0;
};

// Whole-image prediction: plan, extract, pad, predict, crop and stitch.
// Throws ConfigurationError when tile_size exceeds the model input size.
InferenceResult predict_image(const fs::path& image_path, const model::SegmentationModel& model,
                              const InferenceOptions& options,
                              const ProgressCallback& progress = nullptr);

// Single-band GeoTIFF on the source grid: Byte {0,1} mask, or the Float32
// confidence map when `probability` is set.
void write_prediction(const fs::path& path, const InferenceResult& result, bool probability,
                      const std::string& compress = "");

} // namespace floodseg::pipeline
