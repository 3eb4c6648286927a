// common/config/session_config.cpp
#include "common/config/session_config.h"
#include "common/utils/yaml_json.h"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace catalyst {

SessionConfig session_config_from_json(const nlohmann::json& j) {
    SessionConfig config;
    if (j.is_null()) {
        return config; // empty file
    }
    if (!j.is_object()) {
        throw std::runtime_error("Session config must be a mapping");
    }

    if (j.contains("poll_interval_ms")) {
        const auto& v = j["poll_interval_ms"];
        if (!v.is_number_integer() || v.get<long long>() < 0) {
            throw std::runtime_error("'poll_interval_ms' must be a non-negative integer");
        }
        config.poll_interval = std::chrono::milliseconds(v.get<long long>());
    }
    if (j.contains("trace_enabled")) {
        if (!j["trace_enabled"].is_boolean()) {
            throw std::runtime_error("'trace_enabled' must be a boolean");
        }
        config.trace_enabled = j["trace_enabled"].get<bool>();
    }
    if (j.contains("max_trace_records")) {
        const auto& v = j["max_trace_records"];
        if (!v.is_number_integer() || v.get<long long>() < 0) {
            throw std::runtime_error("'max_trace_records' must be a non-negative integer");
        }
        config.max_trace_records = v.get<size_t>();
    }
    if (j.contains("verbose")) {
        if (!j["verbose"].is_boolean()) {
            throw std::runtime_error("'verbose' must be a boolean");
        }
        config.verbose = j["verbose"].get<bool>();
    }
    return config;
}

SessionConfig load_session_config(const std::string& config_path) {
    namespace fs = std::filesystem;

    std::error_code ec;
    if (!fs::exists(config_path, ec)) {
        std::cerr << "[WARNING] Session config not found, using defaults: " << config_path << std::endl;
        return SessionConfig{};
    }

    nlohmann::json j;
    try {
        j = yaml_to_json(YAML::LoadFile(config_path));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Cannot parse session config '" + config_path + "': " + e.what());
    }

    try {
        return session_config_from_json(j);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error("Invalid session config '" + config_path + "': " + e.what());
    }
}

} // namespace catalyst
