#pragma once

#include "floodseg/core/types.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>

namespace floodseg::test {

// Removes its directory on destruction.
class ScopedTempDir {
public:
    explicit ScopedTempDir(const std::string& tag) {
        static std::atomic<int> counter{0};
        const auto stamp =
            std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("floodseg_" + tag + "_" + std::to_string(stamp) + "_" +
                 std::to_string(counter.fetch_add(1)));
        std::filesystem::create_directories(path_);
    }
    ~ScopedTempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Band b, pixel (y, x) = b * 100000 + y * 1000 + x: every sample is unique.
inline PixelBuffer make_ramp(int channels, int width, int height) {
    PixelBuffer buf;
    for (int b = 0; b < channels; ++b) {
        Matrix2Dd band(height, width);
        for (int y = 0; y < height; ++y) {
            for (int x = 0; x < width; ++x) {
                band(y, x) = b * 100000.0 + y * 1000.0 + x;
            }
        }
        buf.bands.push_back(band);
    }
    return buf;
}

inline RasterProfile make_profile(int channels, int width, int height,
                                  SampleType dtype = SampleType::FLOAT32) {
    RasterProfile p;
    p.width = width;
    p.height = height;
    p.band_count = channels;
    p.dtype = dtype;
    p.transform = {500000.0, 10.0, 0.0, 4600000.0, 0.0, -10.0};
    p.crs_wkt =
        "PROJCS[\"WGS 84 / UTM zone 33N\",GEOGCS[\"WGS 84\",DATUM[\"WGS_1984\","
        "SPHEROID[\"WGS 84\",6378137,298.257223563]],PRIMEM[\"Greenwich\",0],"
        "UNIT[\"degree\",0.0174532925199433]],PROJECTION[\"Transverse_Mercator\"],"
        "PARAMETER[\"latitude_of_origin\",0],PARAMETER[\"central_meridian\",15],"
        "PARAMETER[\"scale_factor\",0.9996],PARAMETER[\"false_easting\",500000],"
        "PARAMETER[\"false_northing\",0],UNIT[\"metre\",1]]";
    return p;
}

} // namespace floodseg::test
