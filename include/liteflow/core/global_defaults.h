#ifndef LITEFLOW_CORE_GLOBAL_DEFAULTS_H
#define LITEFLOW_CORE_GLOBAL_DEFAULTS_H

#include "common/types.h"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace liteflow {

// Workflow-level defaults taken from <global>, or inherited from a parent
// workflow through the job configuration.
struct GlobalDefaults {
    std::optional<std::string> name_node;
    std::optional<std::string> job_tracker;
    std::vector<std::string> job_xmls;
    std::optional<Properties> configuration; // unset when <global> has no <configuration>
};

void to_json(nlohmann::json& j, const GlobalDefaults& defaults);
void from_json(const nlohmann::json& j, GlobalDefaults& defaults);

// Opaque string form handed between cooperating processes
std::string encode_global_defaults(const std::optional<GlobalDefaults>& defaults);

// Throws GLOBAL_DEFAULTS_DECODE_FAILURE on malformed input.
// An encoded "no defaults" value decodes to nullopt.
std::optional<GlobalDefaults> decode_global_defaults(const std::string& encoded);

} // namespace liteflow

#endif // LITEFLOW_CORE_GLOBAL_DEFAULTS_H
