#include "floodseg/config/configuration.hpp"
#include "floodseg/core/errors.hpp"
#include "floodseg/core/events.hpp"
#include "floodseg/core/types.hpp"
#include "floodseg/core/utils.hpp"
#include "floodseg/metrics/mask_stats.hpp"
#include "floodseg/model/segmentation_model.hpp"
#include "floodseg/pipeline/dataset.hpp"
#include "floodseg/pipeline/inference.hpp"
#include "floodseg/tiling/window_planner.hpp"

#include <CLI/CLI.hpp>

#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace fs = std::filesystem;
using floodseg::Phase;
using json = nlohmann::json;

namespace {

class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b) : a_(a), b_(b) {}

protected:
  int overflow(int c) override {
    if (c == EOF)
      return EOF;
    const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
    const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
    return (ra == EOF || rb == EOF) ? EOF : c;
  }

  int sync() override {
    int ra = a_ ? a_->pubsync() : 0;
    int rb = b_ ? b_->pubsync() : 0;
    return (ra == 0 && rb == 0) ? 0 : -1;
  }

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

// Event stream on stdout, mirrored to --log-file when given.
class EventLog {
public:
  explicit EventLog(const std::string &log_path) {
    if (!log_path.empty()) {
      fs::path p(log_path);
      if (p.has_parent_path()) {
        floodseg::core::ensure_directory(p.parent_path());
      }
      file_.open(p, std::ios::out | std::ios::app);
      if (!file_) {
        throw floodseg::IOError("Cannot open log file: " + log_path);
      }
    }
    tee_ = std::make_unique<TeeBuf>(std::cout.rdbuf(),
                                    file_.is_open() ? file_.rdbuf() : nullptr);
    out_ = std::make_unique<std::ostream>(tee_.get());
  }

  std::ostream &out() { return *out_; }

private:
  std::ofstream file_;
  std::unique_ptr<TeeBuf> tee_;
  std::unique_ptr<std::ostream> out_;
};

floodseg::config::Config load_config(const std::string &config_path) {
  floodseg::config::Config cfg;
  if (!config_path.empty()) {
    if (!fs::exists(config_path)) {
      throw floodseg::IOError("Config file not found: " + config_path);
    }
    cfg = floodseg::config::Config::load(config_path);
  }
  cfg.validate();
  return cfg;
}

floodseg::pipeline::SplitOptions split_options(const floodseg::config::Config &cfg) {
  floodseg::pipeline::SplitOptions opts;
  opts.tile_size = cfg.tiling.tile_size;
  opts.overlap = cfg.tiling.overlap;
  opts.images_dir = cfg.dataset.images_dir;
  opts.masks_dir = cfg.dataset.masks_dir;
  opts.compress = cfg.output.compress;
  opts.parallel_workers = cfg.runtime.parallel_workers;
  return opts;
}

json plan_to_json(const floodseg::TilePlan &plan) {
  json windows = json::array();
  for (const auto &w : plan.windows) {
    windows.push_back({{"x_off", w.x_off},
                       {"y_off", w.y_off},
                       {"width", w.width},
                       {"height", w.height}});
  }
  return {{"image_width", plan.image_width},
          {"image_height", plan.image_height},
          {"tile_size", plan.tile_size},
          {"overlap", plan.overlap},
          {"step", plan.step},
          {"windows", windows}};
}

int plan_command(int width, int height, const std::string &config_path,
                 std::optional<int> tile_size, std::optional<int> overlap) {
  try {
    floodseg::config::Config cfg = load_config(config_path);
    const int ts = tile_size.value_or(cfg.tiling.tile_size);
    const int ov = overlap.value_or(cfg.tiling.overlap);
    floodseg::TilePlan plan = floodseg::tiling::plan_windows(width, height, ts, ov);
    std::cout << plan_to_json(plan).dump(2) << std::endl;
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}

int split_command(const std::string &config_path, const std::string &image,
                  const std::string &mask, const std::string &output_dir,
                  const std::string &image_id, const std::string &log_path) {
  using namespace floodseg;

  EventLog log(log_path);
  std::ostream &log_file = log.out();
  core::EventEmitter emitter;
  const std::string run_id = core::get_run_id();

  emitter.run_start(run_id,
                    {{"command", "split"},
                     {"config_path", config_path},
                     {"image", image},
                     {"mask", mask},
                     {"output_dir", output_dir}},
                    log_file);

  try {
    config::Config cfg = load_config(config_path);
    pipeline::SplitOptions opts = split_options(cfg);
    opts.image_id = image_id;

    std::optional<fs::path> mask_path;
    if (!mask.empty()) mask_path = fs::path(mask);

    emitter.phase_start(run_id, Phase::WRITE,
                        {{"tile_size", opts.tile_size}, {"overlap", opts.overlap}},
                        log_file);
    pipeline::SplitResult result = pipeline::split_image(
        image, output_dir, mask_path, opts,
        [&](std::size_t done, std::size_t total) {
          emitter.phase_progress(run_id, Phase::WRITE, done, total,
                                 "tiles " + std::to_string(done) + "/" +
                                     std::to_string(total),
                                 log_file);
        });
    emitter.phase_end(run_id, Phase::WRITE, "ok",
                      {{"image_id", result.image_id},
                       {"tiles", result.records.size()}},
                      log_file);

    const fs::path manifest = fs::path(output_dir) / cfg.dataset.manifest_name;
    pipeline::write_manifest(manifest, {result});

    std::cout << "Wrote " << result.records.size() << " tiles for '"
              << result.image_id << "' to " << output_dir << std::endl;
    emitter.run_end(run_id, true, "ok", log_file);
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    emitter.error(run_id, e.what(), log_file);
    emitter.run_end(run_id, false, "error", log_file);
    return 1;
  }
}

int split_batch_command(const std::string &config_path,
                        const std::string &input_dir,
                        const std::string &mask_dir,
                        const std::string &output_dir,
                        const std::string &log_path) {
  using namespace floodseg;

  EventLog log(log_path);
  std::ostream &log_file = log.out();
  core::EventEmitter emitter;
  const std::string run_id = core::get_run_id();

  emitter.run_start(run_id,
                    {{"command", "split-batch"},
                     {"config_path", config_path},
                     {"input_dir", input_dir},
                     {"mask_dir", mask_dir},
                     {"output_dir", output_dir}},
                    log_file);

  try {
    config::Config cfg = load_config(config_path);
    std::optional<fs::path> masks;
    if (!mask_dir.empty()) masks = fs::path(mask_dir);

    emitter.phase_start(run_id, Phase::WRITE, {{"pattern", cfg.dataset.pattern}},
                        log_file);
    pipeline::BatchResult batch = pipeline::split_batch(
        input_dir, masks, output_dir, split_options(cfg), cfg.dataset.pattern,
        cfg.runtime.continue_on_error,
        [&](const fs::path &img, std::size_t index, std::size_t total,
            const std::string &error) {
          if (!error.empty()) {
            emitter.warning(run_id, img.filename().string() + ": " + error,
                            log_file);
          }
          emitter.phase_progress(run_id, Phase::WRITE, index + 1, total,
                                 img.filename().string(), log_file);
        });
    emitter.phase_end(run_id, Phase::WRITE,
                      batch.failures.empty() ? "ok" : "partial",
                      {{"images_ok", batch.results.size()},
                       {"images_failed", batch.failures.size()}},
                      log_file);

    const fs::path manifest = fs::path(output_dir) / cfg.dataset.manifest_name;
    pipeline::write_manifest(manifest, batch.results);

    for (const auto &f : batch.failures) {
      std::cerr << "Failed: " << f.image_path.string() << ": " << f.message
                << std::endl;
    }
    std::cout << "Split " << batch.results.size() << " images ("
              << batch.failures.size() << " failed); manifest "
              << manifest.string() << std::endl;

    const bool ok = batch.failures.empty();
    emitter.run_end(run_id, ok, ok ? "ok" : "partial", log_file);
    return ok ? 0 : 1;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    emitter.error(run_id, e.what(), log_file);
    emitter.run_end(run_id, false, "error", log_file);
    return 1;
  }
}

int infer_command(const std::string &config_path, const std::string &image,
                  const std::string &output, bool probability,
                  const std::string &log_path) {
  using namespace floodseg;

  EventLog log(log_path);
  std::ostream &log_file = log.out();
  core::EventEmitter emitter;
  const std::string run_id = core::get_run_id();

  emitter.run_start(run_id,
                    {{"command", "infer"},
                     {"config_path", config_path},
                     {"image", image},
                     {"output", output}},
                    log_file);

  try {
    config::Config cfg = load_config(config_path);
    std::unique_ptr<model::SegmentationModel> seg_model = model::make_model(cfg.model);

    pipeline::InferenceOptions opts;
    opts.tile_size = cfg.tiling.tile_size;
    opts.overlap = cfg.tiling.overlap;
    opts.policy = string_to_stitch_policy(cfg.stitching.policy).value_or(StitchPolicy::LAST_WRITE);
    opts.threshold = cfg.stitching.threshold;

    emitter.phase_start(run_id, Phase::INFERENCE,
                        {{"model", cfg.model.type},
                         {"input_size", seg_model->input_size()},
                         {"policy", stitch_policy_to_string(opts.policy)}},
                        log_file);
    const std::string image_id = fs::path(image).stem().string();
    pipeline::InferenceResult result = pipeline::predict_image(
        image, *seg_model, opts, [&](std::size_t done, std::size_t total) {
          emitter.tile_processed(run_id, Phase::INFERENCE, image_id,
                                 static_cast<int>(done) - 1, total, log_file);
        });
    emitter.phase_end(run_id, Phase::INFERENCE, "ok",
                      {{"tiles", result.tile_count},
                       {"width", result.profile.width},
                       {"height", result.profile.height},
                       {"dtype", sample_type_to_string(result.profile.dtype)}},
                      log_file);

    const bool write_prob = probability || cfg.output.write_probability;
    emitter.phase_start(run_id, Phase::STITCH, {{"output", output}}, log_file);
    pipeline::write_prediction(output, result, write_prob, cfg.output.compress);

    const metrics::MaskStats stats =
        metrics::compute_mask_stats(result.mask, result.profile.transform);
    emitter.phase_end(run_id, Phase::STITCH, "ok",
                      {{"water_pixels", stats.water_pixels},
                       {"total_pixels", stats.total_pixels},
                       {"water_fraction", stats.water_fraction},
                       {"pixel_area", stats.pixel_area},
                       {"water_area", stats.water_area}},
                      log_file);

    std::cout << "Water fraction: " << stats.water_fraction << " ("
              << stats.water_pixels << "/" << stats.total_pixels
              << " px), output " << output << std::endl;
    emitter.run_end(run_id, true, "ok", log_file);
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    emitter.error(run_id, e.what(), log_file);
    emitter.run_end(run_id, false, "error", log_file);
    return 1;
  }
}

int validate_config_command(const std::string &config_path) {
  try {
    load_config(config_path);
    std::cout << "Config OK: " << config_path << std::endl;
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"floodseg - Sentinel-2 tiling and mask reassembly"};
  app.require_subcommand(1);

  std::string config_path, log_path;
  std::string image, mask, output_dir, image_id, input_dir, mask_dir, output;
  int width = 0, height = 0;
  int tile_size = 0, overlap = 0;
  bool probability = false;

  auto plan_cmd = app.add_subcommand("plan", "Print the window plan for an image size");
  plan_cmd->add_option("--width", width, "Image width")->required();
  plan_cmd->add_option("--height", height, "Image height")->required();
  plan_cmd->add_option("--config", config_path, "Path to config.yaml");
  auto tile_opt = plan_cmd->add_option("--tile-size", tile_size, "Tile size (overrides config)");
  auto overlap_opt = plan_cmd->add_option("--overlap", overlap, "Overlap (overrides config)");

  auto split_cmd = app.add_subcommand("split", "Split one image (and mask) into GeoTIFF tiles");
  split_cmd->add_option("--config", config_path, "Path to config.yaml");
  split_cmd->add_option("--image", image, "Source GeoTIFF")->required();
  split_cmd->add_option("--mask", mask, "Co-registered mask GeoTIFF");
  split_cmd->add_option("--output-dir", output_dir, "Output folder")->required();
  split_cmd->add_option("--image-id", image_id, "Tile name prefix (default: file stem)");
  split_cmd->add_option("--log-file", log_path, "Append JSON-lines events to file");

  auto batch_cmd = app.add_subcommand("split-batch", "Split every image in a directory");
  batch_cmd->add_option("--config", config_path, "Path to config.yaml");
  batch_cmd->add_option("--input-dir", input_dir, "Image directory")->required();
  batch_cmd->add_option("--mask-dir", mask_dir, "Mask directory (same file names)");
  batch_cmd->add_option("--output-dir", output_dir, "Output folder")->required();
  batch_cmd->add_option("--log-file", log_path, "Append JSON-lines events to file");

  auto infer_cmd = app.add_subcommand("infer", "Predict a full-resolution water mask");
  infer_cmd->add_option("--config", config_path, "Path to config.yaml");
  infer_cmd->add_option("--image", image, "Source GeoTIFF")->required();
  infer_cmd->add_option("--output", output, "Output mask GeoTIFF")->required();
  infer_cmd->add_flag("--probability", probability, "Write Float32 confidence instead of a mask");
  infer_cmd->add_option("--log-file", log_path, "Append JSON-lines events to file");

  auto schema_cmd = app.add_subcommand("schema", "Print the config JSON schema");

  auto validate_cmd = app.add_subcommand("validate-config", "Validate a config file");
  validate_cmd->add_option("--config", config_path, "Path to config.yaml")->required();

  CLI11_PARSE(app, argc, argv);

  if (plan_cmd->parsed()) {
    std::optional<int> ts, ov;
    if (tile_opt->count() > 0) ts = tile_size;
    if (overlap_opt->count() > 0) ov = overlap;
    return plan_command(width, height, config_path, ts, ov);
  }

  try {
    if (split_cmd->parsed()) {
      return split_command(config_path, image, mask, output_dir, image_id, log_path);
    }
    if (batch_cmd->parsed()) {
      return split_batch_command(config_path, input_dir, mask_dir, output_dir, log_path);
    }
    if (infer_cmd->parsed()) {
      return infer_command(config_path, image, output, probability, log_path);
    }
  } catch (const floodseg::IOError &e) {
    // log file could not be opened
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  if (schema_cmd->parsed()) {
    std::cout << floodseg::config::get_schema_json() << std::endl;
    return 0;
  }
  if (validate_cmd->parsed()) {
    return validate_config_command(config_path);
  }

  std::cerr << app.help() << std::endl;
  return 1;
}
