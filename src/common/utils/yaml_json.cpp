// common/utils/yaml_json.cpp
#include "common/utils/yaml_json.h"
#include <cerrno>
#include <cstdlib>
#include <string>

namespace catalyst {

namespace {

nlohmann::json plain_scalar_to_json(const std::string& s) {
    if (s == "true" || s == "True" || s == "TRUE") return true;
    if (s == "false" || s == "False" || s == "FALSE") return false;
    if (s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL") return nullptr;

    // integer first, so "5000" doesn't come back as 5000.0
    errno = 0;
    char* end = nullptr;
    long long as_int = std::strtoll(s.c_str(), &end, 10);
    if (errno == 0 && end == s.c_str() + s.size()) {
        return as_int;
    }

    errno = 0;
    end = nullptr;
    double as_double = std::strtod(s.c_str(), &end);
    if (errno == 0 && end == s.c_str() + s.size()) {
        return as_double;
    }

    return s;
}

} // namespace

nlohmann::json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
            return nullptr;
        case YAML::NodeType::Scalar:
            // yaml-cpp tags quoted scalars with "!"
            if (node.Tag() == "!") {
                return node.Scalar();
            }
            return plain_scalar_to_json(node.Scalar());
        case YAML::NodeType::Sequence: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : node) {
                arr.push_back(yaml_to_json(item));
            }
            return arr;
        }
        case YAML::NodeType::Map: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
            }
            return obj;
        }
        default:
            return nullptr;
    }
}

} // namespace catalyst
