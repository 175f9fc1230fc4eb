#include "floodseg/pipeline/inference.hpp"
#include "floodseg/core/errors.hpp"
#include "floodseg/io/geotiff_io.hpp"
#include "floodseg/tiling/padding.hpp"
#include "floodseg/tiling/window_planner.hpp"

#include <vector>

namespace floodseg::pipeline {

InferenceConsumer::InferenceConsumer(const model::SegmentationModel& model,
                                     tiling::MaskStitcher& stitcher)
    : model_(model), stitcher_(stitcher) {}

void InferenceConsumer::consume(const Tile& tile, const Window& window) {
    if (tile.pixels.channels() != model_.input_channels()) {
        throw ShapeError("tile " + std::to_string(tile.index) + " of '" + tile.image_id +
                         "' has " + std::to_string(tile.pixels.channels()) +
                         " channels, model expects " + std::to_string(model_.input_channels()));
    }

    std::vector<Matrix2Df> channels;
    channels.reserve(tile.pixels.bands.size());
    for (const auto& band : tile.pixels.bands) {
        channels.push_back(band.cast<float>());
    }

    const int size = model_.input_size();
    const tiling::PadExtent extent = tiling::compute_pad_extent(window.width, window.height, size);
    Matrix2Df prediction = model_.predict(tiling::pad_reflect(channels, size));

    if (prediction.rows() != size || prediction.cols() != size) {
        throw ShapeError("model returned " + std::to_string(prediction.cols()) + "x" +
                         std::to_string(prediction.rows()) + " for tile " +
                         std::to_string(tile.index) + " of '" + tile.image_id + "', expected " +
                         std::to_string(size) + "x" + std::to_string(size));
    }

    stitcher_.add(tile.index, tiling::crop_padding(prediction, extent));
}

InferenceResult predict_image(const fs::path& image_path, const model::SegmentationModel& model,
                              const InferenceOptions& options, const ProgressCallback& progress) {
    if (options.tile_size > model.input_size()) {
        throw ConfigurationError("tile_size " + std::to_string(options.tile_size) +
                                 " exceeds model input size " +
                                 std::to_string(model.input_size()));
    }

    io::RasterSource source(image_path);

    InferenceResult result;
    result.profile = source.profile();
    result.plan = tiling::plan_windows(source.width(), source.height(), options.tile_size,
                                       options.overlap);

    tiling::MaskStitcher stitcher(result.plan, options.policy);
    InferenceConsumer consumer(model, stitcher);
    run_tile_plan(source, result.plan, image_path.stem().string(), consumer, progress);

    result.confidence = stitcher.result();
    result.mask = tiling::threshold_mask(result.confidence, options.threshold);
    result.tile_count = stitcher.tiles_added();
    return result;
}

void write_prediction(const fs::path& path, const InferenceResult& result, bool probability,
                      const std::string& compress) {
    RasterProfile profile = result.profile;
    profile.driver = kOutputDriver;
    profile.band_count = 1;
    profile.nodata.reset();
    profile.dtype = probability ? SampleType::FLOAT32 : SampleType::BYTE;

    io::write_mask(path, probability ? result.confidence : result.mask, profile, compress);
}

} // namespace floodseg::pipeline
