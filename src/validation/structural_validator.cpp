#include "liteflow/validation/structural_validator.h"
#include "liteflow/core/errors.h"
#include "liteflow/xml/xml_utils.h"
#include "common/utils.h"
#include <algorithm>
#include <string>

namespace liteflow {

namespace {

std::string join_path(const std::vector<NodeName>& path, std::vector<NodeName>::const_iterator from) {
    std::string text;
    for (auto it = from; it != path.end(); ++it) {
        if (!text.empty()) text += " -> ";
        text += *it;
    }
    return text;
}

} // namespace

StructuralValidator::StructuralValidator(const ActionTypeRegistry& registry, size_t max_depth)
    : registry_(registry), max_depth_(max_depth) {}

TraversalReport StructuralValidator::validate(const WorkflowGraph& graph) const {
    const Node& start = graph.start();
    Walk walk{graph, {}, {}, {}};
    walk.traversed[start.name] = VisitStatus::VISITING;
    visit(walk, start);
    return std::move(walk.report);
}

void StructuralValidator::visit(Walk& walk, const Node& node) const {
    if (walk.path.size() >= max_depth_) {
        throw WorkflowException(ErrorCode::TRAVERSAL_TOO_DEEP,
                                "Workflow nesting exceeds " + std::to_string(max_depth_) + " nodes at '" + node.name + "'");
    }

    if (!node.is<StartNode>() && !is_valid_node_name(node.name)) {
        throw WorkflowException(ErrorCode::INVALID_IDENTIFIER,
                                "Invalid node name '" + node.name + "': expected [a-zA-Z_][-_a-zA-Z0-9]* of at most " +
                                    std::to_string(MAX_NODE_NAME_LENGTH) + " characters");
    }
    if (node.is<ActionNode>()) {
        check_action(node);
    }
    if (node.is<ForkNode>()) {
        walk.report.forks.push_back(node.name);
    }
    if (node.is<JoinNode>()) {
        walk.report.joins.push_back(node.name);
    }
    if (node.is<EndNode>() || node.is<KillNode>()) {
        walk.traversed[node.name] = VisitStatus::VISITED;
        return;
    }

    walk.path.push_back(node.name);
    for (const NodeName& transition : node.transitions) {
        const Node* target = walk.graph.find(transition);
        if (!target) {
            throw WorkflowException(ErrorCode::DANGLING_TRANSITION,
                                    "Node '" + node.name + "' transitions to undefined node '" + transition + "'");
        }

        auto status = walk.traversed.find(target->name);
        if (status != walk.traversed.end() && status->second == VisitStatus::VISITING) {
            auto from = std::find(walk.path.begin(), walk.path.end(), target->name);
            throw WorkflowException(ErrorCode::CYCLE_DETECTED,
                                    "Cycle detected at node '" + target->name + "': " +
                                        join_path(walk.path, from) + " -> " + target->name);
        }
        if (status != walk.traversed.end() && status->second == VisitStatus::VISITED) {
            continue;
        }

        walk.traversed[target->name] = VisitStatus::VISITING;
        visit(walk, *target);
    }
    walk.path.pop_back();
    walk.traversed[node.name] = VisitStatus::VISITED;
}

void StructuralValidator::check_action(const Node& node) const {
    XmlDocument doc = XmlDocument::parse(node.as<ActionNode>().conf);
    const std::string type = doc.root()->get_name();
    if (!registry_.is_supported(type)) {
        throw WorkflowException(ErrorCode::UNSUPPORTED_ACTION_TYPE,
                                "Action '" + node.name + "' uses unsupported action type <" + type + ">");
    }
}

} // namespace liteflow
