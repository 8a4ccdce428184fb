// main.cpp
#include <iostream>
#include <memory>
#include <string>
#include "liteflow/actions/registry.h"
#include "liteflow/core/errors.h"
#include "liteflow/core/parser.h"
#include "liteflow/xml/schema_validator.h"

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " <workflow.xml> [--site <site.yaml>] [--schema <workflow.xsd>] [--conf key=value]...\n";
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string workflow_path;
    std::string site_path;
    std::string schema_path;
    liteflow::Configuration job_conf;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--site" && has_value) {
            site_path = argv[++i];
        } else if (arg == "--schema" && has_value) {
            schema_path = argv[++i];
        } else if (arg == "--conf" && has_value) {
            const std::string pair = argv[++i];
            const auto eq = pair.find('=');
            if (eq == std::string::npos || eq == 0) {
                std::cerr << "[ERROR] Expected key=value after --conf, got '" << pair << "'\n";
                return 1;
            }
            job_conf.set(pair.substr(0, eq), pair.substr(eq + 1));
        } else if (arg.rfind("--", 0) == 0 || !workflow_path.empty()) {
            print_usage(argv[0]);
            return 1;
        } else {
            workflow_path = arg;
        }
    }
    if (workflow_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        // 1. Site defaults and optional schema
        liteflow::SiteConfig site;
        if (!site_path.empty()) {
            site = liteflow::load_site_config(site_path);
        }
        std::shared_ptr<const liteflow::SchemaValidator> schema;
        if (!schema_path.empty()) {
            schema = std::make_shared<liteflow::XsdSchemaValidator>(schema_path);
        }

        // 2. Parse and validate
        liteflow::ActionTypeRegistry registry;
        liteflow::WorkflowParser parser(registry, site, schema);
        auto parsed = parser.validate_and_parse_file(workflow_path, job_conf);

        // 3. Summary
        const auto& graph = *parsed.graph;
        std::cout << "[OK] Workflow '" << graph.app_name() << "' (" << graph.size() << " nodes)\n";
        for (const auto& name : graph.node_order()) {
            const liteflow::Node* node = graph.find(name);
            std::cout << "  " << liteflow::node_type_name(node->type()) << " " << name;
            if (!node->transitions.empty()) {
                std::cout << " ->";
                for (const auto& to : node->transitions) {
                    std::cout << " " << to;
                }
            }
            std::cout << "\n";
        }
        std::cout << "Forks: " << parsed.report.forks.size() << ", joins: " << parsed.report.joins.size()
                  << (parsed.fork_join_validated ? " (validated)" : " (fork/join validation skipped)") << "\n";

    } catch (const liteflow::WorkflowException& e) {
        std::cerr << "[ERROR] " << liteflow::error_code_name(e.code()) << ": " << e.detail() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
