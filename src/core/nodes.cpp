#include "liteflow/core/nodes.h"
#include "liteflow/core/errors.h"
#include <utility>

namespace liteflow {

// ————————————————————————
// Node factories
// ————————————————————————

Node Node::start(NodeName to) {
    return Node{START_NODE_NAME, {std::move(to)}, StartNode{}};
}

Node Node::end(NodeName name) {
    return Node{std::move(name), {}, EndNode{}};
}

Node Node::kill(NodeName name, std::string message) {
    return Node{std::move(name), {}, KillNode{std::move(message)}};
}

Node Node::action(NodeName name, NodeName ok_to, NodeName error_to, ActionNode action) {
    return Node{std::move(name), {std::move(ok_to), std::move(error_to)}, std::move(action)};
}

Node Node::decision(NodeName name, std::vector<NodeName> branches, std::string switch_statement) {
    return Node{std::move(name), std::move(branches), DecisionNode{std::move(switch_statement)}};
}

Node Node::fork(NodeName name, std::vector<NodeName> paths) {
    return Node{std::move(name), std::move(paths), ForkNode{}};
}

Node Node::join(NodeName name, NodeName to) {
    return Node{std::move(name), {std::move(to)}, JoinNode{}};
}

const char* node_type_name(NodeType type) {
    switch (type) {
        case NodeType::START: return "start";
        case NodeType::END: return "end";
        case NodeType::KILL: return "kill";
        case NodeType::ACTION: return "action";
        case NodeType::DECISION: return "decision";
        case NodeType::FORK: return "fork";
        case NodeType::JOIN: return "join";
    }
    return "unknown";
}

// ————————————————————————
// WorkflowGraph
// ————————————————————————

WorkflowGraph::WorkflowGraph(std::string app_name, std::string definition)
    : app_name_(std::move(app_name)), definition_(std::move(definition)) {}

void WorkflowGraph::add_node(Node node) {
    if (nodes_.count(node.name) > 0) {
        throw WorkflowException(ErrorCode::DUPLICATE_NODE, "Node '" + node.name + "' is already defined");
    }
    NodeName name = node.name;
    order_.push_back(name);
    nodes_.emplace(std::move(name), std::move(node));
}

const Node* WorkflowGraph::find(const NodeName& name) const {
    auto it = nodes_.find(name);
    return it != nodes_.end() ? &it->second : nullptr;
}

Node* WorkflowGraph::find(const NodeName& name) {
    auto it = nodes_.find(name);
    return it != nodes_.end() ? &it->second : nullptr;
}

const Node& WorkflowGraph::start() const {
    const Node* node = find(START_NODE_NAME);
    if (!node) {
        throw WorkflowException(ErrorCode::MISSING_START_NODE, "Workflow '" + app_name_ + "' has no start node");
    }
    return *node;
}

} // namespace liteflow
