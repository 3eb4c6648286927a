#ifndef CATALYST_COMMON_UTILS_YAML_JSON_H
#define CATALYST_COMMON_UTILS_YAML_JSON_H

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace catalyst {

// 将 YAML::Node 转换为 nlohmann::json
// Quoted scalars stay strings; plain scalars become bool, null, integer or
// double when they read as one.
nlohmann::json yaml_to_json(const YAML::Node& node);

} // namespace catalyst

#endif // CATALYST_COMMON_UTILS_YAML_JSON_H
