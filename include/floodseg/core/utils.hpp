#pragma once

#include "types.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace floodseg::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
// `pattern` may hold several globs separated by ';' (e.g. "*.tif;*.tiff").
std::vector<fs::path> discover_rasters(const fs::path& input_dir,
                                       const std::string& pattern = "*.tif;*.tiff");
void ensure_directory(const fs::path& dir);

// Hash utilities
std::string sha256_file(const fs::path& path);

// String utilities
std::vector<std::string> split(const std::string& str, char delimiter);

// Glob pattern matching
bool glob_match(const std::string& pattern, const std::string& str);

} // namespace floodseg::core
