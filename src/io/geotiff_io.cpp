#include "floodseg/io/geotiff_io.hpp"
#include "floodseg/core/errors.hpp"
#include "floodseg/core/utils.hpp"

#include <gdal_priv.h>
#include <cpl_error.h>
#include <cpl_string.h>

#include <memory>
#include <mutex>
#include <utility>

namespace floodseg::io {

namespace {

std::once_flag g_gdal_register_once;

void ensure_gdal_registered() {
    std::call_once(g_gdal_register_once, [] { GDALAllRegister(); });
}

struct DatasetCloser {
    void operator()(GDALDataset* ds) const {
        if (ds) GDALClose(ds);
    }
};

using DatasetPtr = std::unique_ptr<GDALDataset, DatasetCloser>;

std::string last_gdal_error() {
    const char* msg = CPLGetLastErrorMsg();
    if (msg && *msg) return msg;
    return "no detail";
}

GDALDataType to_gdal_type(SampleType type) {
    switch (type) {
        case SampleType::BYTE: return GDT_Byte;
        case SampleType::UINT16: return GDT_UInt16;
        case SampleType::INT16: return GDT_Int16;
        case SampleType::UINT32: return GDT_UInt32;
        case SampleType::INT32: return GDT_Int32;
        case SampleType::FLOAT32: return GDT_Float32;
        case SampleType::FLOAT64: return GDT_Float64;
        default: return GDT_Unknown;
    }
}

SampleType from_gdal_type(GDALDataType type, const fs::path& path) {
    switch (type) {
        case GDT_Byte: return SampleType::BYTE;
        case GDT_UInt16: return SampleType::UINT16;
        case GDT_Int16: return SampleType::INT16;
        case GDT_UInt32: return SampleType::UINT32;
        case GDT_Int32: return SampleType::INT32;
        case GDT_Float32: return SampleType::FLOAT32;
        case GDT_Float64: return SampleType::FLOAT64;
        default:
            throw RasterError("Unsupported sample type " +
                              std::string(GDALGetDataTypeName(type)) + " in " + path.string());
    }
}

RasterProfile profile_from_dataset(GDALDataset* ds, const fs::path& path) {
    RasterProfile profile;

    GDALDriver* driver = ds->GetDriver();
    if (driver) {
        profile.driver = driver->GetDescription();
    }
    profile.width = ds->GetRasterXSize();
    profile.height = ds->GetRasterYSize();
    profile.band_count = ds->GetRasterCount();

    if (profile.band_count < 1) {
        throw RasterError("Raster has no bands: " + path.string());
    }

    GDALRasterBand* band = ds->GetRasterBand(1);
    profile.dtype = from_gdal_type(band->GetRasterDataType(), path);

    double gt[6];
    profile.has_transform = ds->GetGeoTransform(gt) == CE_None;
    if (profile.has_transform) {
        for (int i = 0; i < 6; ++i) {
            profile.transform[static_cast<size_t>(i)] = gt[i];
        }
    }

    const char* wkt = ds->GetProjectionRef();
    if (wkt) {
        profile.crs_wkt = wkt;
    }

    int has_nodata = 0;
    double nodata = band->GetNoDataValue(&has_nodata);
    if (has_nodata) {
        profile.nodata = nodata;
    }

    return profile;
}

} // namespace

RasterSource::RasterSource(const fs::path& path) : path_(path) {
    ensure_gdal_registered();

    DatasetPtr ds(static_cast<GDALDataset*>(
        GDALOpenEx(path.string().c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY,
                   nullptr, nullptr, nullptr)));
    if (!ds) {
        throw RasterError("Cannot open raster " + path.string() + " (" + last_gdal_error() + ")");
    }

    profile_ = profile_from_dataset(ds.get(), path);
    dataset_ = ds.release();
}

RasterSource::~RasterSource() {
    close();
}

RasterSource::RasterSource(RasterSource&& o) noexcept
    : path_(std::move(o.path_)), dataset_(o.dataset_), profile_(std::move(o.profile_)) {
    o.dataset_ = nullptr;
}

RasterSource& RasterSource::operator=(RasterSource&& o) noexcept {
    if (this != &o) {
        close();
        path_ = std::move(o.path_);
        dataset_ = o.dataset_;
        profile_ = std::move(o.profile_);
        o.dataset_ = nullptr;
    }
    return *this;
}

void RasterSource::close() {
    if (dataset_) {
        GDALClose(dataset_);
        dataset_ = nullptr;
    }
}

PixelBuffer RasterSource::read_window(const Window& window) const {
    if (!dataset_) {
        throw IOError("Raster handle is closed: " + path_.string());
    }
    if (window.width <= 0 || window.height <= 0 || window.x_off < 0 || window.y_off < 0 ||
        window.x_off + window.width > profile_.width ||
        window.y_off + window.height > profile_.height) {
        throw IOError("Window (" + std::to_string(window.x_off) + "," +
                      std::to_string(window.y_off) + "," + std::to_string(window.width) + "," +
                      std::to_string(window.height) + ") outside raster " +
                      std::to_string(profile_.width) + "x" + std::to_string(profile_.height) +
                      ": " + path_.string());
    }

    PixelBuffer out;
    out.bands.reserve(static_cast<size_t>(profile_.band_count));

    for (int b = 1; b <= profile_.band_count; ++b) {
        GDALRasterBand* band = dataset_->GetRasterBand(b);
        Matrix2Dd data(window.height, window.width);
        CPLErr err = band->RasterIO(GF_Read, window.x_off, window.y_off,
                                    window.width, window.height,
                                    data.data(), window.width, window.height,
                                    GDT_Float64, 0, 0, nullptr);
        if (err != CE_None) {
            throw RasterError("Read of band " + std::to_string(b) + " failed for " +
                              path_.string() + " (" + last_gdal_error() + ")");
        }
        out.bands.push_back(std::move(data));
    }

    return out;
}

PixelBuffer RasterSource::read_all() const {
    return read_window(Window{0, 0, profile_.width, profile_.height});
}

RasterProfile read_profile(const fs::path& path) {
    RasterSource source(path);
    return source.profile();
}

void write_raster(const fs::path& path, const PixelBuffer& pixels,
                  const RasterProfile& profile, const std::string& compress) {
    if (pixels.channels() != profile.band_count) {
        throw ShapeError("Buffer has " + std::to_string(pixels.channels()) +
                         " bands but profile declares " + std::to_string(profile.band_count) +
                         ": " + path.string());
    }
    for (const auto& band : pixels.bands) {
        if (band.cols() != profile.width || band.rows() != profile.height) {
            throw ShapeError("Band size " + std::to_string(band.cols()) + "x" +
                             std::to_string(band.rows()) + " differs from profile " +
                             std::to_string(profile.width) + "x" +
                             std::to_string(profile.height) + ": " + path.string());
        }
    }

    ensure_gdal_registered();

    if (path.has_parent_path()) {
        core::ensure_directory(path.parent_path());
    }

    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName(profile.driver.c_str());
    if (!driver) {
        throw RasterError("GDAL driver not available: " + profile.driver);
    }

    char** options = nullptr;
    if (!compress.empty()) {
        options = CSLSetNameValue(options, "COMPRESS", compress.c_str());
    }
    DatasetPtr ds(driver->Create(path.string().c_str(), profile.width, profile.height,
                                 profile.band_count, to_gdal_type(profile.dtype), options));
    CSLDestroy(options);
    if (!ds) {
        throw RasterError("Cannot create raster " + path.string() + " (" + last_gdal_error() + ")");
    }

    if (profile.has_transform) {
        double gt[6];
        for (int i = 0; i < 6; ++i) {
            gt[i] = profile.transform[static_cast<size_t>(i)];
        }
        if (ds->SetGeoTransform(gt) != CE_None) {
            throw RasterError("Cannot set geotransform on " + path.string());
        }
    }
    if (!profile.crs_wkt.empty() && ds->SetProjection(profile.crs_wkt.c_str()) != CE_None) {
        throw RasterError("Cannot set projection on " + path.string());
    }

    for (int b = 1; b <= profile.band_count; ++b) {
        GDALRasterBand* band = ds->GetRasterBand(b);
        if (profile.nodata && band->SetNoDataValue(*profile.nodata) != CE_None) {
            throw RasterError("Cannot set nodata on band " + std::to_string(b) + " of " + path.string());
        }
        const Matrix2Dd& data = pixels.bands[static_cast<size_t>(b - 1)];
        CPLErr err = band->RasterIO(GF_Write, 0, 0, profile.width, profile.height,
                                    const_cast<double*>(data.data()),
                                    profile.width, profile.height,
                                    GDT_Float64, 0, 0, nullptr);
        if (err != CE_None) {
            throw RasterError("Write of band " + std::to_string(b) + " failed for " +
                              path.string() + " (" + last_gdal_error() + ")");
        }
    }

    CPLErrorReset();
    ds.reset();
    if (CPLGetLastErrorType() == CE_Failure || CPLGetLastErrorType() == CE_Fatal) {
        throw RasterError("Flush failed for " + path.string() + " (" + last_gdal_error() + ")");
    }
}

void write_mask(const fs::path& path, const Matrix2Df& mask,
                const RasterProfile& profile, const std::string& compress) {
    RasterProfile out = profile;
    out.width = static_cast<int>(mask.cols());
    out.height = static_cast<int>(mask.rows());
    out.band_count = 1;

    PixelBuffer pixels;
    pixels.bands.push_back(mask.cast<double>());

    write_raster(path, pixels, out, compress);
}

} // namespace floodseg::io
