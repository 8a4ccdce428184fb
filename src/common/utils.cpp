// src/common/utils.cpp
#include "common/utils.h"
#include "liteflow/core/errors.h"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>

namespace liteflow {

namespace {

// Optional sign followed by digits; with `allow_dot` at most one '.'
bool is_decimal(const std::string& s, bool allow_dot) {
    size_t i = (!s.empty() && (s[0] == '-' || s[0] == '+')) ? 1 : 0;
    bool seen_digit = false;
    bool seen_dot = false;
    for (; i < s.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        if (std::isdigit(c)) {
            seen_digit = true;
        } else if (c == '.' && allow_dot && !seen_dot) {
            seen_dot = true;
        } else {
            return false;
        }
    }
    return seen_digit;
}

} // namespace

bool is_valid_node_name(std::string_view name) {
    if (name.empty() || name.size() > MAX_NODE_NAME_LENGTH) return false;
    static const std::regex valid(R"(^[a-zA-Z_][\-_a-zA-Z0-9]*$)");
    return std::regex_match(name.begin(), name.end(), valid);
}

std::string trim(std::string_view s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    auto first = std::find_if(s.begin(), s.end(), not_space);
    auto last = std::find_if(s.rbegin(), s.rend(), not_space).base();
    if (first >= last) return {};
    return std::string(first, last);
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string read_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw WorkflowException(ErrorCode::IO_ERROR, "Cannot open file: " + file_path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

Properties yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
            return nullptr;
        case YAML::NodeType::Scalar: {
            const std::string& s = node.Scalar();
            // Quoted scalars stay strings
            if (node.Tag() == "!") return s;
            if (s == "true")  return true;
            if (s == "false") return false;
            if (s == "~" || s.empty()) return nullptr;

            // Only try numeric conversion if it looks like a number
            try {
                if (is_decimal(s, false)) return std::stoll(s);
                if (is_decimal(s, true)) return std::stod(s);
            } catch (const std::out_of_range&) {
                // too large for a number, keep the text
            }
            return s;
        }
        case YAML::NodeType::Sequence: {
            Properties arr = Properties::array();
            for (const auto& item : node) {
                arr.push_back(yaml_to_json(item));
            }
            return arr;
        }
        case YAML::NodeType::Map: {
            Properties obj = Properties::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
            }
            return obj;
        }
        default:
            return nullptr;
    }
}

} // namespace liteflow
