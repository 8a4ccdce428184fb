#ifndef LITEFLOW_COMMON_UTILS_H
#define LITEFLOW_COMMON_UTILS_H

#include "types.h"
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace liteflow {

// Longest legal user node name
inline constexpr size_t MAX_NODE_NAME_LENGTH = 128;

// Node names: a letter or '_' followed by letters, digits, '-' or '_'
bool is_valid_node_name(std::string_view name);

std::string trim(std::string_view s);

std::string to_lower(std::string_view s);

// Reads a whole file; throws IO_ERROR if it cannot be opened
std::string read_file(const std::string& file_path);

// YAML -> JSON, scalars typed the way YAML 1.2 core schema reads them.
// Maps keep document order.
Properties yaml_to_json(const YAML::Node& node);

} // namespace liteflow

#endif // LITEFLOW_COMMON_UTILS_H
