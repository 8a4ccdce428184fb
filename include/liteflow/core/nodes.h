// liteflow/core/nodes.h
#ifndef LITEFLOW_CORE_NODES_H
#define LITEFLOW_CORE_NODES_H

#include "common/types.h"
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace liteflow {

// Variant payloads. Transitions live on Node, not here.
struct StartNode {};

struct EndNode {};

struct KillNode {
    std::string message;
};

// transitions[0] is "ok", transitions[1] is "error"
struct ActionNode {
    std::string action_type;                   // tag of the action-type element, e.g. "map-reduce"
    std::string conf;                          // serialized action-type element, defaults resolved
    std::optional<std::string> cred;
    std::optional<std::string> retry_max;      // after expression resolution
    std::optional<std::string> retry_interval;
};

// One transition per <case>, then the <default>
struct DecisionNode {
    std::string switch_statement; // raw <switch> element, evaluated by the runtime
};

struct ForkNode {};

struct JoinNode {};

using NodeBody = std::variant<StartNode, EndNode, KillNode, ActionNode, DecisionNode, ForkNode, JoinNode>;

template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

struct Node {
    NodeName name;
    std::vector<NodeName> transitions;
    NodeBody body;

    NodeType type() const { return static_cast<NodeType>(body.index()); }

    template<typename T>
    bool is() const { return std::holds_alternative<T>(body); }

    template<typename T>
    const T& as() const { return std::get<T>(body); }

    template<typename T>
    T& as() { return std::get<T>(body); }

    static Node start(NodeName to);
    static Node end(NodeName name);
    static Node kill(NodeName name, std::string message);
    static Node action(NodeName name, NodeName ok_to, NodeName error_to, ActionNode action);
    static Node decision(NodeName name, std::vector<NodeName> branches, std::string switch_statement = {});
    static Node fork(NodeName name, std::vector<NodeName> paths);
    static Node join(NodeName name, NodeName to);
};

const char* node_type_name(NodeType type);

// Name -> node map plus the start node. Built and mutated by the parse
// pipeline only; published as shared_ptr<const WorkflowGraph>.
class WorkflowGraph {
public:
    WorkflowGraph(std::string app_name, std::string definition);

    WorkflowGraph(const WorkflowGraph&) = delete;
    WorkflowGraph& operator=(const WorkflowGraph&) = delete;
    WorkflowGraph(WorkflowGraph&&) = default;
    WorkflowGraph& operator=(WorkflowGraph&&) = default;

    // Throws DUPLICATE_NODE if the name is taken
    void add_node(Node node);

    const Node* find(const NodeName& name) const;
    Node* find(const NodeName& name);

    bool has_start() const { return nodes_.count(START_NODE_NAME) > 0; }
    // Throws MISSING_START_NODE if no start was declared
    const Node& start() const;

    const std::string& app_name() const { return app_name_; }
    const std::string& definition() const { return definition_; }

    // Node names in declaration order
    const std::vector<NodeName>& node_order() const { return order_; }
    size_t size() const { return nodes_.size(); }

private:
    std::string app_name_;
    std::string definition_;
    std::unordered_map<NodeName, Node> nodes_;
    std::vector<NodeName> order_;
};

} // namespace liteflow

#endif // LITEFLOW_CORE_NODES_H
