#ifndef LITEFLOW_COMMON_TYPES_H
#define LITEFLOW_COMMON_TYPES_H

#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace liteflow {

// Node names are the only identity a node has in a definition
using NodeName = std::string; // e.g., "ingest-logs"

// Ordered string properties (insertion order kept, last write wins)
using Properties = nlohmann::ordered_json;

// Node variant tags; the order matches the alternatives of NodeBody
enum class NodeType : uint8_t {
    START,
    END,
    KILL,
    ACTION,
    DECISION,
    FORK,
    JOIN
};

// Reserved name of the start node, never a legal user node name
inline constexpr const char* START_NODE_NAME = ":start:";

// Job configuration keys
inline constexpr const char* WF_VALIDATE_FORK_JOIN = "liteflow.wf.validate.fork-join";
inline constexpr const char* WF_GLOBAL_CONF = "liteflow.wf.globalconf";

// Site configuration keys
inline constexpr const char* SITE_DEFAULT_NAME_NODE = "liteflow.actions.default.name-node";
inline constexpr const char* SITE_DEFAULT_JOB_TRACKER = "liteflow.actions.default.job-tracker";
inline constexpr const char* SITE_DEFAULT_CONFIGURATION = "liteflow.actions.default.configuration";
inline constexpr const char* SITE_VALIDATE_FORK_JOIN = "liteflow.validate.fork-join";
inline constexpr const char* SITE_MAX_DEPTH = "liteflow.validate.max-depth";
inline constexpr const char* SITE_MAX_VISITS = "liteflow.validate.max-visits";
inline constexpr const char* SITE_VERBOSE = "liteflow.verbose";

} // namespace liteflow

#endif // LITEFLOW_COMMON_TYPES_H
