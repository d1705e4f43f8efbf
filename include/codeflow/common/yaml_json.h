#ifndef CODEFLOW_COMMON_YAML_JSON_H
#define CODEFLOW_COMMON_YAML_JSON_H

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace codeflow {

// 将 YAML::Node 转换为 nlohmann::json
// Scalars become bool/null/integer/double where they look like one, else string.
nlohmann::json yaml_to_json(const YAML::Node& node);

} // namespace codeflow

#endif // CODEFLOW_COMMON_YAML_JSON_H
