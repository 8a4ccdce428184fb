#ifndef LITEFLOW_CORE_GRAPH_BUILDER_H
#define LITEFLOW_CORE_GRAPH_BUILDER_H

#include "liteflow/core/configuration.h"
#include "liteflow/core/nodes.h"
#include "liteflow/dsl/expression_resolver.h"
#include <libxml++/libxml++.h>
#include <optional>
#include <string>

namespace liteflow {

// Element tags of a workflow definition
namespace tags {
inline constexpr const char* START = "start";
inline constexpr const char* END = "end";
inline constexpr const char* KILL = "kill";
inline constexpr const char* ACTION = "action";
inline constexpr const char* DECISION = "decision";
inline constexpr const char* FORK = "fork";
inline constexpr const char* JOIN = "join";
inline constexpr const char* GLOBAL = "global";
inline constexpr const char* PARAMETERS = "parameters";
inline constexpr const char* CREDENTIALS = "credentials";
inline constexpr const char* SLA_INFO = "info";

inline constexpr const char* FORK_PATH = "path";
inline constexpr const char* ACTION_OK = "ok";
inline constexpr const char* ACTION_ERROR = "error";
inline constexpr const char* DECISION_SWITCH = "switch";
inline constexpr const char* DECISION_CASE = "case";
inline constexpr const char* DECISION_DEFAULT = "default";
inline constexpr const char* KILL_MESSAGE = "message";

inline constexpr const char* NAME_NODE = "name-node";
inline constexpr const char* JOB_TRACKER = "job-tracker";
inline constexpr const char* JOB_XML = "job-xml";
inline constexpr const char* CONFIGURATION = "configuration";
inline constexpr const char* PROPAGATE_CONFIGURATION = "propagate-configuration";
} // namespace tags

struct BuildResult {
    WorkflowGraph graph;
    std::optional<std::string> global_section; // serialized <global>, consumed by DefaultsResolver
};

// Turns the root element of a definition into an unresolved graph:
// transitions are names, not yet proven to exist.
class GraphBuilder {
public:
    // Throws UNKNOWN_ELEMENT, MALFORMED_DEFINITION, DUPLICATE_NODE,
    // MISSING_START_NODE, EXPRESSION_RESOLUTION_FAILURE
    BuildResult build(const xmlpp::Element* root, std::string definition, const Configuration& job_conf) const;

private:
    Node build_kill(const xmlpp::Element* element) const;
    Node build_fork(const xmlpp::Element* element) const;
    Node build_decision(const xmlpp::Element* element) const;
    Node build_action(const xmlpp::Element* element, const Configuration& job_conf) const;

    ExpressionResolver resolver_;
};

} // namespace liteflow

#endif // LITEFLOW_CORE_GRAPH_BUILDER_H
