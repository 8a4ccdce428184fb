#include "liteflow/core/graph_builder.h"
#include "liteflow/core/errors.h"
#include "liteflow/xml/xml_utils.h"
#include "common/utils.h"
#include <string>
#include <vector>

namespace liteflow {

namespace {

std::string describe(const xmlpp::Element* element) {
    std::string text = "<" + std::string(element->get_name());
    if (auto name = attribute(element, "name")) {
        text += " name=\"" + *name + "\"";
    }
    return text + ">";
}

std::string required_attribute(const xmlpp::Element* element, const char* name) {
    auto value = attribute(element, name);
    if (!value.has_value() || value->empty()) {
        throw WorkflowException(ErrorCode::MALFORMED_DEFINITION,
                                describe(element) + " is missing required attribute '" + name + "'");
    }
    return *value;
}

const xmlpp::Element* required_child(const xmlpp::Element* element, const char* name) {
    const xmlpp::Element* child = first_child_element(element, name);
    if (!child) {
        throw WorkflowException(ErrorCode::MALFORMED_DEFINITION,
                                describe(element) + " is missing required element <" + name + ">");
    }
    return child;
}

std::optional<std::string> non_empty_attribute(const xmlpp::Element* element, const char* name) {
    auto value = attribute(element, name);
    if (value.has_value() && value->empty()) return std::nullopt;
    return value;
}

} // namespace

BuildResult GraphBuilder::build(const xmlpp::Element* root, std::string definition, const Configuration& job_conf) const {
    BuildResult result{WorkflowGraph(attribute(root, "name").value_or(""), std::move(definition)), std::nullopt};
    WorkflowGraph& graph = result.graph;

    for (const xmlpp::Element* element : child_elements(root)) {
        const std::string tag = element->get_name();

        if (tag == tags::START) {
            graph.add_node(Node::start(required_attribute(element, "to")));
        } else if (tag == tags::END) {
            graph.add_node(Node::end(required_attribute(element, "name")));
        } else if (tag == tags::KILL) {
            graph.add_node(build_kill(element));
        } else if (tag == tags::FORK) {
            graph.add_node(build_fork(element));
        } else if (tag == tags::JOIN) {
            graph.add_node(Node::join(required_attribute(element, "name"), required_attribute(element, "to")));
        } else if (tag == tags::DECISION) {
            graph.add_node(build_decision(element));
        } else if (tag == tags::ACTION) {
            graph.add_node(build_action(element, job_conf));
        } else if (tag == tags::GLOBAL) {
            result.global_section = to_xml_string(element);
        } else if (tag == tags::PARAMETERS || tag == tags::CREDENTIALS || tag == tags::SLA_INFO) {
            // consumed elsewhere
        } else {
            throw WorkflowException(ErrorCode::UNKNOWN_ELEMENT, "Malformed definition, unknown element <" + tag + ">");
        }
    }

    if (!graph.has_start()) {
        throw WorkflowException(ErrorCode::MISSING_START_NODE,
                                "Workflow '" + graph.app_name() + "' does not declare a <start> element");
    }
    return result;
}

Node GraphBuilder::build_kill(const xmlpp::Element* element) const {
    std::string message;
    if (const xmlpp::Element* msg = first_child_element(element, tags::KILL_MESSAGE)) {
        message = element_text(msg);
    }
    return Node::kill(required_attribute(element, "name"), std::move(message));
}

Node GraphBuilder::build_fork(const xmlpp::Element* element) const {
    std::string name = required_attribute(element, "name");
    std::vector<NodeName> paths;
    for (const xmlpp::Element* path : child_elements(element, tags::FORK_PATH)) {
        paths.push_back(required_attribute(path, "start"));
    }
    if (paths.empty()) {
        throw WorkflowException(ErrorCode::MALFORMED_DEFINITION, describe(element) + " declares no <path>");
    }
    return Node::fork(std::move(name), std::move(paths));
}

Node GraphBuilder::build_decision(const xmlpp::Element* element) const {
    std::string name = required_attribute(element, "name");
    const xmlpp::Element* sw = required_child(element, tags::DECISION_SWITCH);

    std::vector<NodeName> branches;
    for (const xmlpp::Element* c : child_elements(sw, tags::DECISION_CASE)) {
        branches.push_back(required_attribute(c, "to"));
    }
    auto defaults = child_elements(sw, tags::DECISION_DEFAULT);
    if (defaults.size() != 1) {
        throw WorkflowException(ErrorCode::MALFORMED_DEFINITION,
                                describe(element) + " must have exactly one <default>, found " +
                                    std::to_string(defaults.size()));
    }
    branches.push_back(required_attribute(defaults.front(), "to"));

    return Node::decision(std::move(name), std::move(branches), to_xml_string(sw));
}

Node GraphBuilder::build_action(const xmlpp::Element* element, const Configuration& job_conf) const {
    std::string name = required_attribute(element, "name");

    std::optional<NodeName> ok_to;
    std::optional<NodeName> error_to;
    const xmlpp::Element* action_conf = nullptr;

    for (const xmlpp::Element* child : child_elements(element)) {
        const std::string tag = child->get_name();
        if (tag == tags::ACTION_OK) {
            ok_to = required_attribute(child, "to");
        } else if (tag == tags::ACTION_ERROR) {
            error_to = required_attribute(child, "to");
        } else if (tag == tags::SLA_INFO || tag == tags::CREDENTIALS) {
            continue;
        } else {
            if (action_conf) {
                throw WorkflowException(ErrorCode::MALFORMED_DEFINITION,
                                        describe(element) + " declares more than one action type (<" +
                                            std::string(action_conf->get_name()) + "> and <" + tag + ">)");
            }
            action_conf = child;
        }
    }

    if (!action_conf) {
        throw WorkflowException(ErrorCode::MALFORMED_DEFINITION, describe(element) + " declares no action type");
    }
    if (!ok_to.has_value()) {
        throw WorkflowException(ErrorCode::MALFORMED_DEFINITION, describe(element) + " is missing <ok>");
    }
    if (!error_to.has_value()) {
        throw WorkflowException(ErrorCode::MALFORMED_DEFINITION, describe(element) + " is missing <error>");
    }

    ActionNode action;
    action.action_type = action_conf->get_name();
    action.conf = to_xml_string(action_conf);
    action.cred = non_empty_attribute(element, "cred");
    if (auto retry_max = non_empty_attribute(element, "retry-max")) {
        action.retry_max = resolver_.resolve(*retry_max, job_conf);
    }
    if (auto retry_interval = non_empty_attribute(element, "retry-interval")) {
        action.retry_interval = resolver_.resolve(*retry_interval, job_conf);
    }

    return Node::action(std::move(name), std::move(*ok_to), std::move(*error_to), std::move(action));
}

} // namespace liteflow
