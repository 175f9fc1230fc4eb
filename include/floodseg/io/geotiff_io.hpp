#pragma once

#include "floodseg/core/types.hpp"
#include <string>

class GDALDataset;

namespace floodseg::io {

// Read-only handle on a geo-referenced raster. Not safe to share between
// threads; each worker opens its own.
class RasterSource {
public:
    explicit RasterSource(const fs::path& path);
    ~RasterSource();

    RasterSource(const RasterSource&) = delete;
    RasterSource& operator=(const RasterSource&) = delete;
    RasterSource(RasterSource&& o) noexcept;
    RasterSource& operator=(RasterSource&& o) noexcept;

    const fs::path& path() const { return path_; }
    const RasterProfile& profile() const { return profile_; }
    int width() const { return profile_.width; }
    int height() const { return profile_.height; }
    int band_count() const { return profile_.band_count; }

    // Reads every band inside `window`. Throws IOError when the window is not
    // fully inside the raster.
    PixelBuffer read_window(const Window& window) const;
    PixelBuffer read_all() const;

private:
    void close();

    fs::path path_;
    GDALDataset* dataset_ = nullptr;
    RasterProfile profile_;
};

RasterProfile read_profile(const fs::path& path);

// Creates (or overwrites) `path` with one band per entry of `pixels`.
// Width, height and band count must agree with `profile`.
void write_raster(const fs::path& path, const PixelBuffer& pixels,
                  const RasterProfile& profile, const std::string& compress = "");

// Single-band convenience writer for masks and confidence maps.
void write_mask(const fs::path& path, const Matrix2Df& mask,
                const RasterProfile& profile, const std::string& compress = "");

} // namespace floodseg::io
