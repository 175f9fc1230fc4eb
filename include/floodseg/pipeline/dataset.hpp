#pragma once

#include "floodseg/core/types.hpp"
#include "floodseg/pipeline/tile_consumer.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace floodseg::pipeline {

// Writes each consumed tile to `output_dir/tile_{image_id}_{index}.tif`.
class TileFileWriter : public TileConsumer {
public:
    TileFileWriter(const fs::path& output_dir, const RasterProfile& source_profile,
                   const std::string& compress);

    void consume(const Tile& tile, const Window& window) override;

    // (plan index, written path) in consumption order
    const std::vector<std::pair<int, fs::path>>& written() const { return written_; }

private:
    fs::path output_dir_;
    RasterProfile source_profile_;
    std::string compress_;
    std::vector<std::pair<int, fs::path>> written_;
};

struct SplitOptions {
    int tile_size = 256;
    int overlap = 32;
    std::string image_id;
    std::string images_dir = "images";
    std::string masks_dir = "masks";
    std::string compress;
    int parallel_workers = 1;
};

struct SplitResult {
    std::string image_id;
    fs::path image_path;
    std::optional<fs::path> mask_path;
    std::string image_sha256;
    std::optional<std::string> mask_sha256;
    TilePlan plan;
    std::vector<TilePairRecord> records;  // one per plan index, in plan order
};

// Tiles one image (and its co-registered mask, if given) into
// `output_folder/images_dir` and `output_folder/masks_dir`. Throws IOError when
// the mask and image sizes differ.
SplitResult split_image(const fs::path& image_path, const fs::path& output_folder,
                        const std::optional<fs::path>& mask_path, const SplitOptions& options,
                        const ProgressCallback& progress = nullptr);

struct BatchFailure {
    fs::path image_path;
    std::string message;
};

struct BatchResult {
    std::vector<SplitResult> results;
    std::vector<BatchFailure> failures;
};

// Called once per image; `error` is empty on success.
using ImageCallback = std::function<void(const fs::path& image_path, std::size_t index,
                                         std::size_t total, const std::string& error)>;

// Splits every raster matching `pattern` in `input_dir`. The image id is the
// file stem; the mask is the file of the same name in `mask_dir`. With
// `continue_on_error` a failing image is recorded and the batch goes on.
BatchResult split_batch(const fs::path& input_dir, const std::optional<fs::path>& mask_dir,
                        const fs::path& output_folder, const SplitOptions& options,
                        const std::string& pattern, bool continue_on_error,
                        const ImageCallback& on_image = nullptr);

// JSON manifest of paired tile records; tile paths are stored relative to the
// manifest's directory.
void write_manifest(const fs::path& path, const std::vector<SplitResult>& results);
std::vector<SplitResult> read_manifest(const fs::path& path);

} // namespace floodseg::pipeline
