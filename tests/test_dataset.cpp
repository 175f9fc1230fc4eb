#include "floodseg/core/errors.hpp"
#include "floodseg/io/geotiff_io.hpp"
#include "floodseg/pipeline/dataset.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <fstream>
#include <utility>
#include <vector>

using floodseg::PixelBuffer;
using floodseg::SampleType;
using floodseg::test::make_profile;
using floodseg::test::make_ramp;
using floodseg::test::ScopedTempDir;

namespace fs = std::filesystem;
namespace io = floodseg::io;
namespace pipeline = floodseg::pipeline;

namespace {

fs::path write_scene(const fs::path& dir, const std::string& name, int channels, int width,
                     int height) {
    const fs::path p = dir / name;
    io::write_raster(p, make_ramp(channels, width, height), make_profile(channels, width, height));
    return p;
}

fs::path write_mask(const fs::path& dir, const std::string& name, int width, int height) {
    const fs::path p = dir / name;
    PixelBuffer m;
    floodseg::Matrix2Dd band(height, width);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            band(y, x) = (x + y) % 2;
        }
    }
    m.bands.push_back(band);
    io::write_raster(p, m, make_profile(1, width, height, SampleType::BYTE));
    return p;
}

pipeline::SplitOptions small_tiles() {
    pipeline::SplitOptions opts;
    opts.tile_size = 16;
    opts.overlap = 4;
    return opts;
}

} // namespace

TEST_CASE("split_image_writes_paired_image_and_mask_tiles") {
    ScopedTempDir tmp("split_pair");
    const fs::path image = write_scene(tmp.path(), "scene.tif", 10, 40, 30);
    const fs::path mask = write_mask(tmp.path(), "scene_mask.tif", 40, 30);
    const fs::path out = tmp.path() / "out";

    auto result = pipeline::split_image(image, out, mask, small_tiles());

    REQUIRE(result.image_id == "scene");
    REQUIRE(result.records.size() == result.plan.windows.size());
    REQUIRE(result.image_sha256.size() == 64);
    REQUIRE(result.mask_sha256.has_value());

    for (size_t i = 0; i < result.records.size(); ++i) {
        const auto& rec = result.records[i];
        REQUIRE(rec.index == static_cast<int>(i));
        REQUIRE(rec.window == result.plan.windows[i]);
        REQUIRE(rec.image_tile.string() ==
                (out / "images" / ("tile_scene_" + std::to_string(i) + ".tif")).string());
        REQUIRE(rec.mask_tile.has_value());
        REQUIRE(rec.mask_tile->string() ==
                (out / "masks" / ("tile_scene_" + std::to_string(i) + ".tif")).string());

        io::RasterSource img_tile(rec.image_tile);
        io::RasterSource mask_tile(*rec.mask_tile);
        REQUIRE(img_tile.band_count() == 10);
        REQUIRE(mask_tile.band_count() == 1);
        REQUIRE(mask_tile.profile().dtype == SampleType::BYTE);
        REQUIRE(img_tile.width() == rec.window.width);
        REQUIRE(mask_tile.width() == rec.window.width);
        REQUIRE(img_tile.height() == mask_tile.height());
    }
}

TEST_CASE("split_image_uses_explicit_image_id") {
    ScopedTempDir tmp("split_id");
    const fs::path image = write_scene(tmp.path(), "scene.tif", 2, 20, 20);
    auto opts = small_tiles();
    opts.image_id = "S2B_T33UUP";

    auto result = pipeline::split_image(image, tmp.path() / "out", std::nullopt, opts);
    REQUIRE(result.records.front().image_tile.filename().string() == "tile_S2B_T33UUP_0.tif");
    REQUIRE_FALSE(result.records.front().mask_tile.has_value());
    REQUIRE_FALSE(fs::exists(tmp.path() / "out" / "masks"));
}

TEST_CASE("split_image_rejects_mask_of_different_size") {
    ScopedTempDir tmp("split_mismatch");
    const fs::path image = write_scene(tmp.path(), "scene.tif", 10, 40, 30);
    const fs::path mask = write_mask(tmp.path(), "mask.tif", 40, 31);

    REQUIRE_THROWS_AS(pipeline::split_image(image, tmp.path() / "out", mask, small_tiles()),
                      floodseg::IOError);
}

TEST_CASE("split_image_parallel_matches_sequential") {
    ScopedTempDir tmp("split_parallel");
    const fs::path image = write_scene(tmp.path(), "scene.tif", 3, 70, 45);
    const fs::path mask = write_mask(tmp.path(), "mask.tif", 70, 45);

    auto seq = pipeline::split_image(image, tmp.path() / "seq", mask, small_tiles());
    auto opts = small_tiles();
    opts.parallel_workers = 4;
    auto par = pipeline::split_image(image, tmp.path() / "par", mask, opts);

    REQUIRE(seq.records.size() == par.records.size());
    for (size_t i = 0; i < seq.records.size(); ++i) {
        REQUIRE(seq.records[i].window == par.records[i].window);
        REQUIRE(seq.records[i].image_tile.filename().string() ==
                par.records[i].image_tile.filename().string());
        REQUIRE(fs::exists(par.records[i].image_tile));
        REQUIRE(fs::exists(*par.records[i].mask_tile));

        const auto a = io::RasterSource(seq.records[i].image_tile).read_all();
        const auto b = io::RasterSource(par.records[i].image_tile).read_all();
        REQUIRE((a.bands[2].array() == b.bands[2].array()).all());
    }
}

TEST_CASE("split_image_reports_progress") {
    ScopedTempDir tmp("split_progress");
    const fs::path image = write_scene(tmp.path(), "scene.tif", 1, 40, 40);

    std::size_t last = 0, total_seen = 0;
    auto result = pipeline::split_image(image, tmp.path() / "out", std::nullopt, small_tiles(),
                                        [&](std::size_t done, std::size_t total) {
                                            last = done;
                                            total_seen = total;
                                        });
    REQUIRE(total_seen == result.plan.windows.size());
    REQUIRE(last == total_seen);
}

TEST_CASE("split_image_progress_counts_image_and_mask_passes") {
    ScopedTempDir tmp("split_progress_mask");
    const fs::path image = write_scene(tmp.path(), "scene.tif", 2, 40, 40);
    const fs::path mask = write_mask(tmp.path(), "mask.tif", 40, 40);

    std::vector<std::pair<std::size_t, std::size_t>> calls;
    auto result = pipeline::split_image(image, tmp.path() / "out", mask, small_tiles(),
                                        [&](std::size_t done, std::size_t total) {
                                            calls.emplace_back(done, total);
                                        });

    const std::size_t n = result.plan.windows.size();
    REQUIRE(calls.size() == 2 * n);
    for (std::size_t i = 0; i < calls.size(); ++i) {
        REQUIRE(calls[i].first == i + 1);
        REQUIRE(calls[i].second == 2 * n);
    }
}

TEST_CASE("split_of_non_geotiff_source_writes_geotiff_tiles") {
    ScopedTempDir tmp("split_envi");
    auto profile = make_profile(3, 40, 30);
    profile.driver = "ENVI";
    const fs::path image = tmp.path() / "scene.img";
    io::write_raster(image, make_ramp(3, 40, 30), profile);
    REQUIRE(io::read_profile(image).driver == "ENVI");

    auto result = pipeline::split_image(image, tmp.path() / "out", std::nullopt, small_tiles());
    REQUIRE_FALSE(result.records.empty());
    for (const auto& rec : result.records) {
        const auto tile = io::read_profile(rec.image_tile);
        REQUIRE(tile.driver == "GTiff");
        REQUIRE(tile.band_count == 3);
        REQUIRE(tile.width == rec.window.width);
    }
}

TEST_CASE("manifest_round_trip_keeps_records") {
    ScopedTempDir tmp("manifest");
    const fs::path image = write_scene(tmp.path(), "scene.tif", 2, 40, 30);
    const fs::path mask = write_mask(tmp.path(), "mask.tif", 40, 30);
    const fs::path out = tmp.path() / "out";

    auto result = pipeline::split_image(image, out, mask, small_tiles());
    pipeline::write_manifest(out / "manifest.json", {result});

    auto loaded = pipeline::read_manifest(out / "manifest.json");
    REQUIRE(loaded.size() == 1);
    const auto& r = loaded.front();
    REQUIRE(r.image_id == "scene");
    REQUIRE(r.image_sha256 == result.image_sha256);
    REQUIRE(r.mask_sha256 == result.mask_sha256);
    REQUIRE(r.plan.windows == result.plan.windows);
    REQUIRE(r.records.size() == result.records.size());
    for (size_t i = 0; i < r.records.size(); ++i) {
        REQUIRE(r.records[i].window == result.records[i].window);
        REQUIRE(fs::equivalent(r.records[i].image_tile, result.records[i].image_tile));
        REQUIRE(fs::equivalent(*r.records[i].mask_tile, *result.records[i].mask_tile));
    }
}

TEST_CASE("read_manifest_rejects_malformed_file") {
    ScopedTempDir tmp("manifest_bad");
    const fs::path p = tmp.path() / "manifest.json";
    {
        std::ofstream f(p);
        f << "{ not json";
    }
    REQUIRE_THROWS_AS(pipeline::read_manifest(p), floodseg::IOError);
    REQUIRE_THROWS_AS(pipeline::read_manifest(tmp.path() / "missing.json"), floodseg::IOError);
}

TEST_CASE("split_batch_isolates_failing_images") {
    ScopedTempDir tmp("batch");
    const fs::path images = tmp.path() / "images";
    const fs::path masks = tmp.path() / "masks";
    write_scene(images, "a.tif", 2, 20, 20);
    write_scene(images, "b.tif", 2, 20, 20);
    write_mask(masks, "a.tif", 20, 20);
    write_mask(masks, "b.tif", 20, 21);

    std::size_t callbacks = 0;
    auto batch = pipeline::split_batch(images, masks, tmp.path() / "out", small_tiles(),
                                       "*.tif", true,
                                       [&](const fs::path&, std::size_t, std::size_t total,
                                           const std::string&) {
                                           REQUIRE(total == 2);
                                           ++callbacks;
                                       });

    REQUIRE(callbacks == 2);
    REQUIRE(batch.results.size() == 1);
    REQUIRE(batch.results.front().image_id == "a");
    REQUIRE(batch.failures.size() == 1);
    REQUIRE(batch.failures.front().image_path.filename().string() == "b.tif");
}

TEST_CASE("split_batch_stops_on_error_when_asked") {
    ScopedTempDir tmp("batch_stop");
    const fs::path images = tmp.path() / "images";
    write_scene(images, "a.tif", 1, 20, 20);

    REQUIRE_THROWS_AS(pipeline::split_batch(images, tmp.path() / "no_masks", tmp.path() / "out",
                                            small_tiles(), "*.tif", false),
                      floodseg::IOError);
}
