#include "floodseg/config/configuration.hpp"
#include "floodseg/core/errors.hpp"
#include "floodseg/core/types.hpp"

#include <fstream>

namespace floodseg::config {

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigurationError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["tiling"]) {
            auto t = node["tiling"];
            if (t["tile_size"]) cfg.tiling.tile_size = t["tile_size"].as<int>();
            if (t["overlap"]) cfg.tiling.overlap = t["overlap"].as<int>();
        }

        if (node["dataset"]) {
            auto d = node["dataset"];
            if (d["images_dir"]) cfg.dataset.images_dir = d["images_dir"].as<std::string>();
            if (d["masks_dir"]) cfg.dataset.masks_dir = d["masks_dir"].as<std::string>();
            if (d["manifest_name"]) cfg.dataset.manifest_name = d["manifest_name"].as<std::string>();
            if (d["pattern"]) cfg.dataset.pattern = d["pattern"].as<std::string>();
        }

        if (node["model"]) {
            auto m = node["model"];
            if (m["type"]) cfg.model.type = m["type"].as<std::string>();
            if (m["input_size"]) cfg.model.input_size = m["input_size"].as<int>();
            if (m["input_channels"]) cfg.model.input_channels = m["input_channels"].as<int>();
            if (m["green_band"]) cfg.model.green_band = m["green_band"].as<int>();
            if (m["nir_band"]) cfg.model.nir_band = m["nir_band"].as<int>();
            if (m["ndwi_threshold"]) cfg.model.ndwi_threshold = m["ndwi_threshold"].as<float>();
            if (m["logistic_gain"]) cfg.model.logistic_gain = m["logistic_gain"].as<float>();
        }

        if (node["stitching"]) {
            auto s = node["stitching"];
            if (s["policy"]) cfg.stitching.policy = s["policy"].as<std::string>();
            if (s["threshold"]) cfg.stitching.threshold = s["threshold"].as<float>();
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["compress"]) cfg.output.compress = o["compress"].as<std::string>();
            if (o["write_probability"]) cfg.output.write_probability = o["write_probability"].as<bool>();
        }

        if (node["runtime"]) {
            auto r = node["runtime"];
            if (r["parallel_workers"]) cfg.runtime.parallel_workers = r["parallel_workers"].as<int>();
            if (r["continue_on_error"]) cfg.runtime.continue_on_error = r["continue_on_error"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("Invalid value type: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigurationError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["tiling"]["tile_size"] = tiling.tile_size;
    node["tiling"]["overlap"] = tiling.overlap;

    node["dataset"]["images_dir"] = dataset.images_dir;
    node["dataset"]["masks_dir"] = dataset.masks_dir;
    node["dataset"]["manifest_name"] = dataset.manifest_name;
    node["dataset"]["pattern"] = dataset.pattern;

    node["model"]["type"] = model.type;
    node["model"]["input_size"] = model.input_size;
    node["model"]["input_channels"] = model.input_channels;
    node["model"]["green_band"] = model.green_band;
    node["model"]["nir_band"] = model.nir_band;
    node["model"]["ndwi_threshold"] = model.ndwi_threshold;
    node["model"]["logistic_gain"] = model.logistic_gain;

    node["stitching"]["policy"] = stitching.policy;
    node["stitching"]["threshold"] = stitching.threshold;

    node["output"]["compress"] = output.compress;
    node["output"]["write_probability"] = output.write_probability;

    node["runtime"]["parallel_workers"] = runtime.parallel_workers;
    node["runtime"]["continue_on_error"] = runtime.continue_on_error;

    return node;
}

void Config::validate() const {
    if (tiling.tile_size < 1) {
        throw ConfigurationError("tiling.tile_size must be >= 1");
    }
    if (tiling.overlap < 0 || tiling.overlap >= tiling.tile_size) {
        throw ConfigurationError("tiling.overlap must be in [0, tiling.tile_size)");
    }

    if (dataset.images_dir.empty() || dataset.masks_dir.empty()) {
        throw ConfigurationError("dataset.images_dir and dataset.masks_dir must not be empty");
    }
    if (dataset.images_dir == dataset.masks_dir) {
        throw ConfigurationError("dataset.images_dir and dataset.masks_dir must differ");
    }
    if (dataset.manifest_name.empty()) {
        throw ConfigurationError("dataset.manifest_name must not be empty");
    }

    if (model.type != "ndwi") {
        throw ConfigurationError("model.type must be 'ndwi'");
    }
    if (model.input_size < tiling.tile_size) {
        throw ConfigurationError("model.input_size must be >= tiling.tile_size (tiles are padded, never cropped)");
    }
    if (model.input_channels < 1) {
        throw ConfigurationError("model.input_channels must be >= 1");
    }
    if (model.green_band < 0 || model.green_band >= model.input_channels ||
        model.nir_band < 0 || model.nir_band >= model.input_channels) {
        throw ConfigurationError("model.green_band/nir_band must be in [0, model.input_channels)");
    }
    if (model.green_band == model.nir_band) {
        throw ConfigurationError("model.green_band and model.nir_band must differ");
    }
    if (model.ndwi_threshold < -1.0f || model.ndwi_threshold > 1.0f) {
        throw ConfigurationError("model.ndwi_threshold must be in [-1,1]");
    }
    if (!(model.logistic_gain > 0.0f)) {
        throw ConfigurationError("model.logistic_gain must be > 0");
    }

    if (!string_to_stitch_policy(stitching.policy)) {
        throw ConfigurationError("stitching.policy must be 'last_write', 'mean' or 'max_confidence'");
    }
    if (stitching.threshold < 0.0f || stitching.threshold > 1.0f) {
        throw ConfigurationError("stitching.threshold must be in [0,1]");
    }

    if (runtime.parallel_workers < 1 || runtime.parallel_workers > 64) {
        throw ConfigurationError("runtime.parallel_workers must be in [1,64]");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "tiling": {
      "type": "object",
      "properties": {
        "tile_size": {"type": "integer", "minimum": 1},
        "overlap": {"type": "integer", "minimum": 0}
      }
    },
    "dataset": {
      "type": "object",
      "properties": {
        "images_dir": {"type": "string"},
        "masks_dir": {"type": "string"},
        "manifest_name": {"type": "string"},
        "pattern": {"type": "string"}
      }
    },
    "model": {
      "type": "object",
      "properties": {
        "type": {"type": "string", "enum": ["ndwi"]},
        "input_size": {"type": "integer", "minimum": 1},
        "input_channels": {"type": "integer", "minimum": 1},
        "green_band": {"type": "integer", "minimum": 0},
        "nir_band": {"type": "integer", "minimum": 0},
        "ndwi_threshold": {"type": "number", "minimum": -1, "maximum": 1},
        "logistic_gain": {"type": "number", "exclusiveMinimum": 0}
      }
    },
    "stitching": {
      "type": "object",
      "properties": {
        "policy": {"type": "string", "enum": ["last_write", "mean", "max_confidence"]},
        "threshold": {"type": "number", "minimum": 0, "maximum": 1}
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "compress": {"type": "string"},
        "write_probability": {"type": "boolean"}
      }
    },
    "runtime": {
      "type": "object",
      "properties": {
        "parallel_workers": {"type": "integer", "minimum": 1, "maximum": 64},
        "continue_on_error": {"type": "boolean"}
      }
    }
  }
})";
}

} // namespace floodseg::config
