#ifndef LITEFLOW_CORE_PARSER_H
#define LITEFLOW_CORE_PARSER_H

#include "liteflow/actions/registry.h"
#include "liteflow/core/configuration.h"
#include "liteflow/core/global_defaults.h"
#include "liteflow/core/nodes.h"
#include "liteflow/validation/structural_validator.h"
#include "liteflow/xml/schema_validator.h"
#include <memory>
#include <optional>
#include <string>

namespace liteflow {

struct ParsedWorkflow {
    std::shared_ptr<const WorkflowGraph> graph;
    TraversalReport report;
    std::optional<GlobalDefaults> global_defaults;
    bool fork_join_validated = false;

    ParsedWorkflow() = default;
    ParsedWorkflow(const ParsedWorkflow&) = delete;
    ParsedWorkflow& operator=(const ParsedWorkflow&) = delete;
    ParsedWorkflow(ParsedWorkflow&&) = default;
    ParsedWorkflow& operator=(ParsedWorkflow&&) = default;
};

// Compiles a workflow definition into a validated graph:
// schema -> XML -> parameters -> graph -> defaults -> structure -> fork/join.
// Holds no per-parse state; one instance may serve concurrent callers.
class WorkflowParser {
public:
    WorkflowParser(const ActionTypeRegistry& registry, SiteConfig site,
                   std::shared_ptr<const SchemaValidator> schema = nullptr);

    // `job_conf` receives parameter defaults and, for a sub-workflow that
    // propagates configuration, the encoded global defaults.
    // Throws WorkflowException; the first fault aborts the parse.
    ParsedWorkflow validate_and_parse(const std::string& definition, Configuration& job_conf) const;
    ParsedWorkflow validate_and_parse_file(const std::string& file_path, Configuration& job_conf) const;

    const SiteConfig& site() const { return site_; }

private:
    const ActionTypeRegistry& registry_;
    SiteConfig site_;
    std::shared_ptr<const SchemaValidator> schema_;
};

} // namespace liteflow

#endif // LITEFLOW_CORE_PARSER_H
