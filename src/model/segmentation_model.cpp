#include "floodseg/model/segmentation_model.hpp"
#include "floodseg/core/errors.hpp"

#include <cmath>
#include <string>

namespace floodseg::model {

NdwiWaterModel::NdwiWaterModel(int input_size, int input_channels, int green_band,
                               int nir_band, float threshold, float gain)
    : input_size_(input_size),
      input_channels_(input_channels),
      green_band_(green_band),
      nir_band_(nir_band),
      threshold_(threshold),
      gain_(gain) {
    if (input_size_ < 1 || input_channels_ < 1) {
        throw ConfigurationError("ndwi model needs positive input size and channel count");
    }
    if (green_band_ < 0 || green_band_ >= input_channels_ || nir_band_ < 0 ||
        nir_band_ >= input_channels_) {
        throw ConfigurationError("ndwi band index out of range for " +
                                 std::to_string(input_channels_) + " channels");
    }
}

Matrix2Df NdwiWaterModel::predict(const std::vector<Matrix2Df>& channels) const {
    if (static_cast<int>(channels.size()) != input_channels_) {
        throw ShapeError("ndwi model expects " + std::to_string(input_channels_) +
                         " channels, got " + std::to_string(channels.size()));
    }
    const Matrix2Df& green = channels[static_cast<size_t>(green_band_)];
    const Matrix2Df& nir = channels[static_cast<size_t>(nir_band_)];
    if (green.rows() != input_size_ || green.cols() != input_size_ ||
        nir.rows() != input_size_ || nir.cols() != input_size_) {
        throw ShapeError("ndwi model expects " + std::to_string(input_size_) + "x" +
                         std::to_string(input_size_) + " input");
    }

    Matrix2Df out(input_size_, input_size_);
    for (Eigen::Index i = 0; i < out.size(); ++i) {
        const float g = green.data()[i];
        const float n = nir.data()[i];
        const float denom = g + n;
        const float ndwi = std::abs(denom) > 1e-12f ? (g - n) / denom : 0.0f;
        out.data()[i] = 1.0f / (1.0f + std::exp(-gain_ * (ndwi - threshold_)));
    }
    return out;
}

std::unique_ptr<SegmentationModel> make_model(const config::ModelConfig& cfg) {
    if (cfg.type == "ndwi") {
        return std::make_unique<NdwiWaterModel>(cfg.input_size, cfg.input_channels,
                                                cfg.green_band, cfg.nir_band,
                                                cfg.ndwi_threshold, cfg.logistic_gain);
    }
    throw ConfigurationError("Unknown model type: " + cfg.type);
}

} // namespace floodseg::model
