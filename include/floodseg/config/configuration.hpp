#pragma once

#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace floodseg::config {

namespace fs = std::filesystem;

struct TilingConfig {
  int tile_size = 256;
  int overlap = 32;
};

struct DatasetConfig {
  std::string images_dir = "images";
  std::string masks_dir = "masks";
  std::string manifest_name = "manifest.json";
  std::string pattern = "*.tif;*.tiff";
};

struct ModelConfig {
  std::string type = "ndwi"; // ndwi
  int input_size = 256;      // fixed spatial size the model consumes
  int input_channels = 10;   // Sentinel-2: B2 B3 B4 B5 B6 B7 B8 B8A B11 B12
  int green_band = 1;        // zero-based band position of B3
  int nir_band = 6;          // zero-based band position of B8
  float ndwi_threshold = 0.0f;
  float logistic_gain = 10.0f;
};

struct StitchingConfig {
  std::string policy = "last_write"; // last_write | mean | max_confidence
  float threshold = 0.5f;
};

struct OutputConfig {
  std::string compress = "DEFLATE"; // empty = uncompressed
  bool write_probability = false;
};

struct RuntimeConfig {
  int parallel_workers = 1;
  bool continue_on_error = true;
};

struct Config {
  TilingConfig tiling;
  DatasetConfig dataset;
  ModelConfig model;
  StitchingConfig stitching;
  OutputConfig output;
  RuntimeConfig runtime;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

std::string get_schema_json();

} // namespace floodseg::config
