#pragma once

#include "floodseg/config/configuration.hpp"
#include "floodseg/core/types.hpp"

#include <memory>
#include <vector>

namespace floodseg::model {

/**
 * Pixel-wise water segmentation collaborator.
 *
 * predict() receives exactly input_channels() matrices of
 * input_size() x input_size() and returns one probability channel of the same
 * spatial size.
 */
class SegmentationModel {
public:
    virtual ~SegmentationModel() = default;

    virtual int input_size() const = 0;
    virtual int input_channels() const = 0;
    virtual Matrix2Df predict(const std::vector<Matrix2Df>& channels) const = 0;
};

// Normalized difference water index (green - nir) / (green + nir) mapped to a
// probability with 1 / (1 + exp(-gain * (ndwi - threshold))).
class NdwiWaterModel : public SegmentationModel {
public:
    NdwiWaterModel(int input_size, int input_channels, int green_band, int nir_band,
                   float threshold, float gain);

    int input_size() const override { return input_size_; }
    int input_channels() const override { return input_channels_; }
    Matrix2Df predict(const std::vector<Matrix2Df>& channels) const override;

private:
    int input_size_;
    int input_channels_;
    int green_band_;
    int nir_band_;
    float threshold_;
    float gain_;
};

// Throws ConfigurationError for an unknown model type.
std::unique_ptr<SegmentationModel> make_model(const config::ModelConfig& cfg);

} // namespace floodseg::model
