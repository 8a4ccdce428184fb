#include "liteflow/core/parser.h"
#include "liteflow/core/defaults_resolver.h"
#include "liteflow/core/errors.h"
#include "liteflow/core/graph_builder.h"
#include "liteflow/core/parameter_verifier.h"
#include "liteflow/validation/fork_join_validator.h"
#include "liteflow/xml/xml_utils.h"
#include "common/utils.h"
#include <iostream>

namespace liteflow {

WorkflowParser::WorkflowParser(const ActionTypeRegistry& registry, SiteConfig site,
                               std::shared_ptr<const SchemaValidator> schema)
    : registry_(registry), site_(std::move(site)), schema_(std::move(schema)) {
    site_.normalize();
}

ParsedWorkflow WorkflowParser::validate_and_parse(const std::string& definition, Configuration& job_conf) const {
    if (schema_) {
        schema_->validate(definition);
    }

    XmlDocument doc = XmlDocument::parse(definition);
    const xmlpp::Element* root = doc.root();

    ParameterVerifier::verify(root, job_conf);

    BuildResult built = GraphBuilder().build(root, definition, job_conf);
    if (site_.verbose) {
        std::cerr << "[DEBUG] Built workflow '" << built.graph.app_name() << "' with "
                  << built.graph.size() << " nodes" << std::endl;
    }

    ParsedWorkflow parsed;
    parsed.global_defaults = DefaultsResolver(registry_, site_).resolve(built, job_conf);

    parsed.report = StructuralValidator(registry_, site_.max_traversal_depth).validate(built.graph);

    const bool check_fork_join = site_.validate_fork_join && job_conf.get_bool(WF_VALIDATE_FORK_JOIN, true);
    if (check_fork_join) {
        ForkJoinValidator(site_.max_traversal_depth, site_.max_traversal_visits).validate(built.graph, parsed.report);
        parsed.fork_join_validated = true;
    } else if (site_.verbose) {
        std::cerr << "[DEBUG] Fork/join validation disabled for '" << built.graph.app_name() << "'" << std::endl;
    }

    parsed.graph = std::make_shared<const WorkflowGraph>(std::move(built.graph));
    return parsed;
}

ParsedWorkflow WorkflowParser::validate_and_parse_file(const std::string& file_path, Configuration& job_conf) const {
    return validate_and_parse(read_file(file_path), job_conf);
}

} // namespace liteflow
