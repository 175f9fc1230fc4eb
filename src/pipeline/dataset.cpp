#include "floodseg/pipeline/dataset.hpp"
#include "floodseg/core/errors.hpp"
#include "floodseg/core/utils.hpp"
#include "floodseg/io/geotiff_io.hpp"
#include "floodseg/tiling/tile_extractor.hpp"
#include "floodseg/tiling/tile_writer.hpp"
#include "floodseg/tiling/window_planner.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <fstream>
#include <mutex>
#include <thread>

#include <nlohmann/json.hpp>

namespace floodseg::pipeline {

using json = nlohmann::json;

TileFileWriter::TileFileWriter(const fs::path& output_dir, const RasterProfile& source_profile,
                               const std::string& compress)
    : output_dir_(output_dir), source_profile_(source_profile), compress_(compress) {}

void TileFileWriter::consume(const Tile& tile, const Window& window) {
    if (tile.window != window) {
        throw PipelineError("tile " + std::to_string(tile.index) +
                            " was extracted from a different window");
    }
    const fs::path out = output_dir_ / tiling::tile_filename(tile.image_id, tile.index);
    tiling::write_tile(tile, source_profile_, out, compress_);
    written_.emplace_back(tile.index, out);
}

namespace {

int compute_worker_count(int requested, size_t task_count) {
    int workers = std::max(1, requested);
    int cpu_cores = static_cast<int>(std::thread::hardware_concurrency());
    if (cpu_cores > 0) {
        workers = std::min(workers, cpu_cores);
    }
    if (task_count > 0) {
        workers = std::min(workers, static_cast<int>(task_count));
    }
    return std::max(1, workers);
}

void check_same_size(const io::RasterSource& image, const io::RasterSource& mask) {
    if (image.width() != mask.width() || image.height() != mask.height()) {
        throw IOError("mask " + mask.path().string() + " is " + std::to_string(mask.width()) +
                      "x" + std::to_string(mask.height()) + " but image " +
                      image.path().string() + " is " + std::to_string(image.width()) + "x" +
                      std::to_string(image.height()));
    }
}

void collect(const TileFileWriter& writer, std::vector<TilePairRecord>& records, bool mask) {
    for (const auto& [index, path] : writer.written()) {
        TilePairRecord& rec = records[static_cast<size_t>(index)];
        if (mask) {
            rec.mask_tile = path;
        } else {
            rec.image_tile = path;
        }
    }
}

} // namespace

SplitResult split_image(const fs::path& image_path, const fs::path& output_folder,
                        const std::optional<fs::path>& mask_path, const SplitOptions& options,
                        const ProgressCallback& progress) {
    io::RasterSource image(image_path);
    std::optional<io::RasterSource> mask;
    if (mask_path) {
        mask.emplace(*mask_path);
        check_same_size(image, *mask);
    }

    SplitResult result;
    result.image_id = options.image_id.empty() ? image_path.stem().string() : options.image_id;
    result.image_path = image_path;
    result.mask_path = mask_path;
    result.plan = tiling::plan_windows(image.width(), image.height(), options.tile_size,
                                       options.overlap);

    const fs::path images_out = output_folder / options.images_dir;
    const fs::path masks_out = output_folder / options.masks_dir;
    core::ensure_directory(images_out);
    if (mask) core::ensure_directory(masks_out);

    const size_t total = result.plan.windows.size();
    result.records.resize(total);
    for (size_t i = 0; i < total; ++i) {
        result.records[i].index = static_cast<int>(i);
        result.records[i].window = result.plan.windows[i];
    }

    const int workers = compute_worker_count(options.parallel_workers, total);

    if (workers <= 1) {
        // With a mask, progress counts both passes: image tiles first, then mask tiles.
        const size_t passes = mask ? 2 : 1;
        ProgressCallback image_progress;
        ProgressCallback mask_progress;
        if (progress) {
            image_progress = [&](size_t done, size_t n) { progress(done, n * passes); };
            mask_progress = [&](size_t done, size_t n) { progress(n + done, n * passes); };
        }

        TileFileWriter image_writer(images_out, image.profile(), options.compress);
        run_tile_plan(image, result.plan, result.image_id, image_writer, image_progress);
        collect(image_writer, result.records, false);
        if (mask) {
            TileFileWriter mask_writer(masks_out, mask->profile(), options.compress);
            run_tile_plan(*mask, result.plan, result.image_id, mask_writer, mask_progress);
            collect(mask_writer, result.records, true);
        }
    } else {
        std::atomic<size_t> next{0};
        std::atomic<size_t> done{0};
        std::atomic<bool> failed{false};
        std::mutex result_mutex;
        std::mutex progress_mutex;
        std::exception_ptr first_error;

        auto worker = [&]() {
            try {
                // GDAL dataset handles are not thread-safe; each worker opens its own.
                io::RasterSource local_image(image_path);
                std::optional<io::RasterSource> local_mask;
                if (mask_path) local_mask.emplace(*mask_path);

                TileFileWriter image_writer(images_out, local_image.profile(), options.compress);
                std::optional<TileFileWriter> mask_writer;
                if (local_mask) mask_writer.emplace(masks_out, local_mask->profile(), options.compress);

                while (!failed.load(std::memory_order_relaxed)) {
                    const size_t i = next.fetch_add(1);
                    if (i >= total) break;
                    const Window& w = result.plan.windows[i];
                    const int index = static_cast<int>(i);

                    image_writer.consume(tiling::extract_tile(local_image, w, index, result.image_id), w);
                    if (mask_writer) {
                        mask_writer->consume(tiling::extract_tile(*local_mask, w, index, result.image_id), w);
                    }

                    const size_t d = done.fetch_add(1) + 1;
                    if (progress) {
                        std::lock_guard<std::mutex> lock(progress_mutex);
                        progress(d, total);
                    }
                }

                std::lock_guard<std::mutex> lock(result_mutex);
                collect(image_writer, result.records, false);
                if (mask_writer) collect(*mask_writer, result.records, true);
            } catch (const std::exception&) {
                failed.store(true, std::memory_order_relaxed);
                std::lock_guard<std::mutex> lock(result_mutex);
                if (!first_error) first_error = std::current_exception();
            }
        };

        std::vector<std::thread> pool;
        pool.reserve(static_cast<size_t>(workers));
        for (int i = 0; i < workers; ++i) {
            pool.emplace_back(worker);
        }
        for (auto& t : pool) {
            t.join();
        }
        if (first_error) std::rethrow_exception(first_error);
    }

    result.image_sha256 = core::sha256_file(image_path);
    if (mask_path) result.mask_sha256 = core::sha256_file(*mask_path);
    return result;
}

BatchResult split_batch(const fs::path& input_dir, const std::optional<fs::path>& mask_dir,
                        const fs::path& output_folder, const SplitOptions& options,
                        const std::string& pattern, bool continue_on_error,
                        const ImageCallback& on_image) {
    const std::vector<fs::path> images = core::discover_rasters(input_dir, pattern);
    BatchResult batch;

    for (size_t i = 0; i < images.size(); ++i) {
        const fs::path& image_path = images[i];
        SplitOptions per_image = options;
        per_image.image_id = image_path.stem().string();

        std::optional<fs::path> mask_path;
        if (mask_dir) mask_path = *mask_dir / image_path.filename();

        try {
            if (mask_path && !fs::exists(*mask_path)) {
                throw IOError("no mask for " + image_path.filename().string() + " in " +
                              mask_dir->string());
            }
            batch.results.push_back(split_image(image_path, output_folder, mask_path, per_image));
            if (on_image) on_image(image_path, i, images.size(), "");
        } catch (const FloodSegError& e) {
            if (!continue_on_error) throw;
            batch.failures.push_back({image_path, e.what()});
            if (on_image) on_image(image_path, i, images.size(), e.what());
        }
    }

    return batch;
}

namespace {

std::string relative_to(const fs::path& path, const fs::path& base) {
    return fs::relative(fs::absolute(path), fs::absolute(base)).generic_string();
}

json window_to_json(const Window& w) {
    return json::array({w.x_off, w.y_off, w.width, w.height});
}

Window window_from_json(const json& j) {
    if (!j.is_array() || j.size() != 4) {
        throw IOError("manifest window must be [x_off, y_off, width, height]");
    }
    return Window{j[0].get<int>(), j[1].get<int>(), j[2].get<int>(), j[3].get<int>()};
}

} // namespace

void write_manifest(const fs::path& path, const std::vector<SplitResult>& results) {
    const fs::path base = path.parent_path().empty() ? fs::path(".") : path.parent_path();
    core::ensure_directory(base);

    json images = json::array();
    for (const auto& r : results) {
        json entry;
        entry["image_id"] = r.image_id;
        entry["image_path"] = r.image_path.string();
        entry["image_sha256"] = r.image_sha256;
        entry["mask_path"] = r.mask_path ? json(r.mask_path->string()) : json(nullptr);
        entry["mask_sha256"] = r.mask_sha256 ? json(*r.mask_sha256) : json(nullptr);
        entry["width"] = r.plan.image_width;
        entry["height"] = r.plan.image_height;
        entry["tile_size"] = r.plan.tile_size;
        entry["overlap"] = r.plan.overlap;

        json tiles = json::array();
        for (const auto& rec : r.records) {
            json t;
            t["index"] = rec.index;
            t["window"] = window_to_json(rec.window);
            t["image"] = relative_to(rec.image_tile, base);
            t["mask"] = rec.mask_tile ? json(relative_to(*rec.mask_tile, base)) : json(nullptr);
            tiles.push_back(t);
        }
        entry["tiles"] = tiles;
        images.push_back(entry);
    }

    json root;
    root["version"] = 1;
    root["created"] = core::get_iso_timestamp();
    root["images"] = images;

    std::ofstream out(path);
    if (!out) {
        throw IOError("Cannot write manifest: " + path.string());
    }
    out << root.dump(2) << "\n";
}

std::vector<SplitResult> read_manifest(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw IOError("Cannot open manifest: " + path.string());
    }

    json root;
    try {
        in >> root;
    } catch (const json::exception& e) {
        throw IOError("Malformed manifest " + path.string() + ": " + e.what());
    }

    const fs::path base = path.parent_path().empty() ? fs::path(".") : path.parent_path();
    std::vector<SplitResult> results;

    try {
        for (const auto& entry : root.at("images")) {
            SplitResult r;
            r.image_id = entry.at("image_id").get<std::string>();
            r.image_path = entry.at("image_path").get<std::string>();
            r.image_sha256 = entry.value("image_sha256", "");
            if (!entry.at("mask_path").is_null()) r.mask_path = entry["mask_path"].get<std::string>();
            if (!entry.at("mask_sha256").is_null()) r.mask_sha256 = entry["mask_sha256"].get<std::string>();

            r.plan = tiling::plan_windows(entry.at("width").get<int>(), entry.at("height").get<int>(),
                                          entry.at("tile_size").get<int>(),
                                          entry.at("overlap").get<int>());

            const auto& tiles = entry.at("tiles");
            if (tiles.size() != r.plan.windows.size()) {
                throw IOError("manifest lists " + std::to_string(tiles.size()) + " tiles for '" +
                              r.image_id + "', plan has " +
                              std::to_string(r.plan.windows.size()));
            }
            for (const auto& t : tiles) {
                TilePairRecord rec;
                rec.index = t.at("index").get<int>();
                rec.window = window_from_json(t.at("window"));
                if (rec.index < 0 || static_cast<size_t>(rec.index) >= r.plan.windows.size() ||
                    r.plan.windows[static_cast<size_t>(rec.index)] != rec.window) {
                    throw IOError("manifest tile " + std::to_string(rec.index) + " of '" +
                                  r.image_id + "' does not match its plan window");
                }
                rec.image_tile = base / t.at("image").get<std::string>();
                if (!t.at("mask").is_null()) rec.mask_tile = base / t["mask"].get<std::string>();
                r.records.push_back(rec);
            }
            results.push_back(std::move(r));
        }
    } catch (const json::exception& e) {
        throw IOError("Invalid manifest " + path.string() + ": " + e.what());
    } catch (const ConfigurationError& e) {
        throw IOError("Invalid manifest " + path.string() + ": " + e.what());
    }

    return results;
}

} // namespace floodseg::pipeline
