#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace floodseg {

namespace fs = std::filesystem;

// Matrix types (row-major, matching raster scanline layout)
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Matrix2Dd = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Affine pixel -> world mapping in GDAL order:
//   x = t[0] + col * t[1] + row * t[2]
//   y = t[3] + col * t[4] + row * t[5]
using GeoTransform = std::array<double, 6>;

inline GeoTransform identity_transform() {
    return {0.0, 1.0, 0.0, 0.0, 0.0, 1.0};
}

// Sample data type of a persisted raster
enum class SampleType {
    BYTE,
    UINT16,
    INT16,
    UINT32,
    INT32,
    FLOAT32,
    FLOAT64
};

inline std::string sample_type_to_string(SampleType type) {
    switch (type) {
        case SampleType::BYTE: return "Byte";
        case SampleType::UINT16: return "UInt16";
        case SampleType::INT16: return "Int16";
        case SampleType::UINT32: return "UInt32";
        case SampleType::INT32: return "Int32";
        case SampleType::FLOAT32: return "Float32";
        case SampleType::FLOAT64: return "Float64";
        default: return "Unknown";
    }
}

// Pixel-space rectangle, always clipped to its raster
struct Window {
    int x_off;
    int y_off;
    int width;
    int height;
};

inline bool operator==(const Window& a, const Window& b) {
    return a.x_off == b.x_off && a.y_off == b.y_off &&
           a.width == b.width && a.height == b.height;
}

inline bool operator!=(const Window& a, const Window& b) {
    return !(a == b);
}

// Immutable, row-major window sequence for one (width, height, tile_size, overlap)
struct TilePlan {
    int image_width = 0;
    int image_height = 0;
    int tile_size = 0;
    int overlap = 0;
    int step = 0;
    std::vector<Window> windows;
};

// Multi-channel pixel block, one matrix per band in band order.
// Samples are held as double so every GeoTIFF sample type round-trips exactly.
struct PixelBuffer {
    std::vector<Matrix2Dd> bands;

    int channels() const { return static_cast<int>(bands.size()); }
    int width() const { return bands.empty() ? 0 : static_cast<int>(bands.front().cols()); }
    int height() const { return bands.empty() ? 0 : static_cast<int>(bands.front().rows()); }
};

// Format of every raster floodseg writes
inline constexpr const char* kOutputDriver = "GTiff";

// Persisted raster metadata
struct RasterProfile {
    std::string driver = kOutputDriver;
    int width = 0;
    int height = 0;
    int band_count = 0;
    SampleType dtype = SampleType::FLOAT32;
    GeoTransform transform = identity_transform();
    bool has_transform = true;  // false when the source carried no geotransform
    std::string crs_wkt;
    std::optional<double> nodata;
};

// A cropped, independently geo-referenced fragment of a raster
struct Tile {
    int index = 0;
    std::string image_id;
    Window window{0, 0, 0, 0};
    PixelBuffer pixels;
    GeoTransform transform = identity_transform();
};

// Explicit image/mask tile correspondence for one plan index
struct TilePairRecord {
    int index = 0;
    Window window{0, 0, 0, 0};
    fs::path image_tile;
    std::optional<fs::path> mask_tile;
};

// Overlap resolution when several tiles cover the same pixel
enum class StitchPolicy {
    LAST_WRITE,
    MEAN,
    MAX_CONFIDENCE
};

inline std::string stitch_policy_to_string(StitchPolicy policy) {
    switch (policy) {
        case StitchPolicy::LAST_WRITE: return "last_write";
        case StitchPolicy::MEAN: return "mean";
        case StitchPolicy::MAX_CONFIDENCE: return "max_confidence";
        default: return "unknown";
    }
}

inline std::optional<StitchPolicy> string_to_stitch_policy(const std::string& s) {
    std::string norm = s;
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (norm == "last_write") return StitchPolicy::LAST_WRITE;
    if (norm == "mean") return StitchPolicy::MEAN;
    if (norm == "max_confidence") return StitchPolicy::MAX_CONFIDENCE;
    return std::nullopt;
}

// Run phase enumeration
enum class Phase {
    PLAN = 0,
    EXTRACT = 1,
    WRITE = 2,
    INFERENCE = 3,
    STITCH = 4,
    DONE = 5
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::PLAN: return "PLAN";
        case Phase::EXTRACT: return "EXTRACT";
        case Phase::WRITE: return "WRITE";
        case Phase::INFERENCE: return "INFERENCE";
        case Phase::STITCH: return "STITCH";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace floodseg
