#ifndef CATALYST_COMMON_CONFIG_SESSION_CONFIG_H
#define CATALYST_COMMON_CONFIG_SESSION_CONFIG_H

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <string>

namespace catalyst {

struct SessionConfig {
    // delay between a finished pass and the next one
    std::chrono::milliseconds poll_interval{5000};
    bool trace_enabled = true;
    size_t max_trace_records = 1024;
    // log status transitions to std::clog
    bool verbose = false;
};

// Reads poll_interval_ms, trace_enabled, max_trace_records and verbose.
// Unknown keys are ignored; a key of the wrong type throws std::runtime_error.
SessionConfig session_config_from_json(const nlohmann::json& j);

// Loads a YAML (or JSON) file. A missing file yields the defaults; a file
// that cannot be parsed throws std::runtime_error.
SessionConfig load_session_config(const std::string& config_path = "catalyst.yaml");

} // namespace catalyst

#endif // CATALYST_COMMON_CONFIG_SESSION_CONFIG_H
