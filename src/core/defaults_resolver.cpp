#include "liteflow/core/defaults_resolver.h"
#include "liteflow/core/errors.h"
#include "liteflow/xml/xml_utils.h"
#include "common/utils.h"
#include <algorithm>
#include <iostream>
#include <vector>

namespace liteflow {

namespace {

bool is_exempt(const std::string& tag) {
    return tag == SUB_WORKFLOW_ACTION || tag == FS_ACTION || tag == tags::GLOBAL;
}

void merge_into(Properties& target, const Properties& layer) {
    for (const auto& [key, value] : layer.items()) {
        target[key] = value;
    }
}

} // namespace

DefaultsResolver::DefaultsResolver(const ActionTypeRegistry& registry, const SiteConfig& site)
    : registry_(registry), site_(site) {}

std::optional<GlobalDefaults> DefaultsResolver::resolve(BuildResult& result, Configuration& job_conf) const {
    std::optional<GlobalDefaults> global;
    const auto inherited = job_conf.get(WF_GLOBAL_CONF);
    if (inherited.has_value()) {
        global = decode_global_defaults(*inherited);
    }

    if (result.global_section.has_value()) {
        XmlDocument doc = XmlDocument::parse(*result.global_section);
        if (inherited.has_value()) {
            // A parent's global section fills the gaps of this one
            apply(doc.root(), tags::GLOBAL, global, nullptr);
        }
        global = parse_global_section(doc.root());
        result.global_section = to_xml_string(doc.root());
    }

    bool propagated = false;
    WorkflowGraph& graph = result.graph;
    for (const NodeName& name : graph.node_order()) {
        Node* node = graph.find(name);
        if (!node || !node->is<ActionNode>()) continue;

        ActionNode& action = node->as<ActionNode>();
        XmlDocument doc = XmlDocument::parse(action.conf);
        xmlpp::Element* root = doc.root();

        if (!propagated && action.action_type == SUB_WORKFLOW_ACTION &&
            first_child_element(root, tags::PROPAGATE_CONFIGURATION) != nullptr) {
            propagated = true;
            job_conf.set(WF_GLOBAL_CONF, encode_global_defaults(global));
        }

        apply(root, name, global, &site_.action_defaults);
        action.conf = to_xml_string(root);
    }
    return global;
}

void DefaultsResolver::apply(xmlpp::Element* element,
                             const std::string& owner,
                             const std::optional<GlobalDefaults>& global,
                             const Properties* config_defaults) const {
    const std::string tag = element->get_name();
    const bool is_global = tag == tags::GLOBAL;

    auto info = registry_.find(tag);
    if (!info.has_value() && !is_global) {
        throw WorkflowException(ErrorCode::UNSUPPORTED_ACTION_TYPE,
                                "Action '" + owner + "' uses unsupported action type <" + tag + ">");
    }

    if (is_exempt(tag) || info->requires_endpoints) {
        apply_endpoints(element, owner, global);
    }
    if (is_global || info->supports_configuration) {
        apply_configuration(element, global, config_defaults);
    }
}

void DefaultsResolver::apply_endpoints(xmlpp::Element* element,
                                       const std::string& owner,
                                       const std::optional<GlobalDefaults>& global) const {
    const std::string tag = element->get_name();
    const bool exempt = is_exempt(tag);

    // Global endpoints are trimmed whether parsed from <global> or inherited
    if (first_child_element(element, tags::NAME_NODE) == nullptr) {
        if (global.has_value() && global->name_node.has_value()) {
            append_text_element(element, tags::NAME_NODE, trim(*global->name_node));
        } else if (site_.default_name_node.has_value()) {
            append_text_element(element, tags::NAME_NODE, *site_.default_name_node);
        } else if (!exempt) {
            throw WorkflowException(ErrorCode::MISSING_REQUIRED_DEFAULT,
                                    "No " + std::string(tags::NAME_NODE) + " defined for action '" + owner + "'");
        }
    }

    // Storage-only actions never talk to the compute endpoint
    if (tag == FS_ACTION) return;

    if (first_child_element(element, tags::JOB_TRACKER) == nullptr) {
        if (global.has_value() && global->job_tracker.has_value()) {
            append_text_element(element, tags::JOB_TRACKER, trim(*global->job_tracker));
        } else if (site_.default_job_tracker.has_value()) {
            append_text_element(element, tags::JOB_TRACKER, *site_.default_job_tracker);
        } else if (!exempt) {
            throw WorkflowException(ErrorCode::MISSING_REQUIRED_DEFAULT,
                                    "No " + std::string(tags::JOB_TRACKER) + " defined for action '" + owner + "'");
        }
    }
}

void DefaultsResolver::apply_configuration(xmlpp::Element* element,
                                           const std::optional<GlobalDefaults>& global,
                                           const Properties* config_defaults) const {
    if (global.has_value() && !global->job_xmls.empty()) {
        std::vector<std::string> local;
        for (const xmlpp::Element* job_xml : child_elements(element, tags::JOB_XML)) {
            local.push_back(element_text(job_xml));
        }
        for (const std::string& shared : global->job_xmls) {
            if (std::find(local.begin(), local.end(), shared) == local.end()) {
                append_text_element(element, tags::JOB_XML, shared);
                local.push_back(shared);
            }
        }
    }

    Properties merged = Properties::object();
    if (config_defaults) {
        merge_into(merged, *config_defaults);
    }
    if (global.has_value() && global->configuration.has_value()) {
        merge_into(merged, *global->configuration);
    }

    xmlpp::Element* configuration = first_child_element(element, tags::CONFIGURATION);
    if (configuration) {
        merge_into(merged, read_properties(configuration));
    } else {
        configuration = element->add_child_element(tags::CONFIGURATION);
    }
    write_properties(configuration, merged);

    if (site_.verbose) {
        std::cerr << "[DEBUG] Resolved " << merged.size() << " configuration properties for <"
                  << element->get_name() << ">" << std::endl;
    }
}

GlobalDefaults DefaultsResolver::parse_global_section(const xmlpp::Element* global) {
    GlobalDefaults defaults;
    if (const xmlpp::Element* jt = first_child_element(global, tags::JOB_TRACKER)) {
        defaults.job_tracker = trim(element_text(jt));
    }
    if (const xmlpp::Element* nn = first_child_element(global, tags::NAME_NODE)) {
        defaults.name_node = trim(element_text(nn));
    }
    for (const xmlpp::Element* job_xml : child_elements(global, tags::JOB_XML)) {
        defaults.job_xmls.push_back(element_text(job_xml));
    }
    if (const xmlpp::Element* conf = first_child_element(global, tags::CONFIGURATION)) {
        defaults.configuration = read_properties(conf);
    }
    return defaults;
}

} // namespace liteflow
