#pragma once

#include <stdexcept>
#include <string>

namespace floodseg {

class FloodSegError : public std::runtime_error {
public:
    explicit FloodSegError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigurationError : public FloodSegError {
public:
    explicit ConfigurationError(const std::string& message)
        : FloodSegError("Configuration error: " + message) {}
};

class IOError : public FloodSegError {
public:
    explicit IOError(const std::string& message)
        : FloodSegError("I/O error: " + message) {}
};

class RasterError : public IOError {
public:
    explicit RasterError(const std::string& message)
        : IOError("GDAL error: " + message) {}
};

class ShapeError : public FloodSegError {
public:
    explicit ShapeError(const std::string& message)
        : FloodSegError("Shape error: " + message) {}
};

class PipelineError : public FloodSegError {
public:
    explicit PipelineError(const std::string& message)
        : FloodSegError("Pipeline error: " + message) {}
};

} // namespace floodseg
