#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace floodseg::core {

using json = nlohmann::json;

/**
 * JSON-lines run events. One object per line with `type`, `run_id` and `ts`,
 * flushed immediately so a consumer can follow a running job.
 */
class EventEmitter {
public:
    EventEmitter() = default;

    void run_start(const std::string& run_id, const json& extra, std::ostream& out);
    void run_end(const std::string& run_id, bool success, const std::string& status, std::ostream& out);

    void phase_start(const std::string& run_id, Phase phase, const json& extra, std::ostream& out);
    void phase_progress(const std::string& run_id, Phase phase, std::size_t current,
                        std::size_t total, const std::string& message, std::ostream& out);
    void phase_end(const std::string& run_id, Phase phase, const std::string& status,
                   const json& extra, std::ostream& out);

    void tile_processed(const std::string& run_id, Phase phase, const std::string& image_id,
                        int tile_index, std::size_t total_tiles, std::ostream& out);

    void warning(const std::string& run_id, const std::string& message, std::ostream& out);
    void error(const std::string& run_id, const std::string& message, std::ostream& out);

private:
    void emit(const json& event, std::ostream& out);
    json base_event(const std::string& type, const std::string& run_id);
};

} // namespace floodseg::core
