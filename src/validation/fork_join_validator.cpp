#include "liteflow/validation/fork_join_validator.h"
#include "liteflow/core/errors.h"
#include <algorithm>
#include <string>

namespace liteflow {

namespace {

std::string format_path(const std::vector<NodeName>& path) {
    std::string text = "[";
    for (size_t i = 0; i < path.size(); ++i) {
        if (i > 0) text += ", ";
        text += path[i];
    }
    return text + "]";
}

// Transition targets without repeats, in order of first occurrence
std::vector<NodeName> distinct_targets(const Node& node) {
    std::vector<NodeName> targets;
    for (const NodeName& name : node.transitions) {
        if (std::find(targets.begin(), targets.end(), name) == targets.end()) {
            targets.push_back(name);
        }
    }
    return targets;
}

const Node& target_node(const WorkflowGraph& graph, const Node& from, const NodeName& name) {
    const Node* target = graph.find(name);
    if (!target) {
        throw WorkflowException(ErrorCode::DANGLING_TRANSITION,
                                "Node '" + from.name + "' transitions to undefined node '" + name + "'");
    }
    return *target;
}

const Node& transition(const WorkflowGraph& graph, const Node& from, size_t index) {
    if (index >= from.transitions.size()) {
        throw WorkflowException(ErrorCode::INVALID_NODE_TYPE,
                                std::string("Node '") + from.name + "' of type " + node_type_name(from.type()) +
                                    " has no transition #" + std::to_string(index));
    }
    return target_node(graph, from, from.transitions[index]);
}

} // namespace

ForkJoinValidator::ForkJoinValidator(size_t max_depth, size_t max_visits)
    : max_depth_(max_depth), max_visits_(max_visits) {}

void ForkJoinValidator::validate(const WorkflowGraph& graph, const TraversalReport& report) const {
    if (report.forks.size() != report.joins.size()) {
        throw WorkflowException(ErrorCode::UNBALANCED_FORK_JOIN_COUNT,
                                "Workflow has " + std::to_string(report.forks.size()) + " fork(s) but " +
                                    std::to_string(report.joins.size()) + " join(s)");
    }
    if (report.forks.empty()) {
        return;
    }

    Walk walk{graph, {}, {}, {}, {}, {}, 0};
    visit(walk, graph.start(), true, std::nullopt);
}

void ForkJoinValidator::visit(Walk& walk, const Node& node, bool reachable_cleanly,
                              const std::optional<NodeName>& top_decision) const {
    if (std::find(walk.path.begin(), walk.path.end(), node.name) != walk.path.end()) {
        throw WorkflowException(ErrorCode::CYCLE_DETECTED,
                                "Cycle detected at node '" + node.name + "', path " + format_path(walk.path));
    }
    if (++walk.visits > max_visits_) {
        throw WorkflowException(ErrorCode::TRAVERSAL_BUDGET_EXCEEDED,
                                "Fork/join validation gave up after " + std::to_string(max_visits_) +
                                    " node visits at '" + node.name + "'");
    }
    if (walk.path.size() >= max_depth_) {
        throw WorkflowException(ErrorCode::TRAVERSAL_TOO_DEEP,
                                "Workflow nesting exceeds " + std::to_string(max_depth_) + " nodes at '" + node.name + "'");
    }
    walk.path.push_back(node.name);

    if (reachable_cleanly && !node.is<KillNode>() && !node.is<JoinNode>() && !node.is<EndNode>()) {
        check_revisit(walk, node, top_decision);
    }

    std::visit(overloaded{
        [&](const StartNode&) {
            visit(walk, transition(walk.graph, node, 0), reachable_cleanly, top_decision);
        },
        [&](const ActionNode&) {
            visit(walk, transition(walk.graph, node, 0), reachable_cleanly, top_decision);
            // Only one of ok/error runs, so the error side may revisit ok-path nodes
            visit(walk, transition(walk.graph, node, 1), false, top_decision);
        },
        [&](const DecisionNode&) {
            // Only the eldest enclosing decision matters
            const std::optional<NodeName> ancestor = top_decision.has_value() ? top_decision : std::optional<NodeName>(node.name);
            for (const NodeName& name : distinct_targets(node)) {
                visit(walk, target_node(walk.graph, node, name), reachable_cleanly, ancestor);
            }
        },
        [&](const ForkNode&) {
            visit_fork(walk, node, reachable_cleanly, top_decision);
        },
        [&](const JoinNode&) {
            visit_join(walk, node, reachable_cleanly, top_decision);
        },
        [&](const KillNode&) {},
        [&](const EndNode&) {
            if (!walk.fork_stack.empty()) {
                walk.path.pop_back();
                const NodeName parent = walk.path.empty() ? std::string() : walk.path.back();
                throw WorkflowException(ErrorCode::PARALLEL_BRANCH_UNJOINED_END,
                                        "Node '" + parent + "' inside fork '" + walk.fork_stack.back() +
                                            "' transitions to end node '" + node.name + "' without a join");
            }
        },
    }, node.body);

    walk.path.pop_back();
}

void ForkJoinValidator::check_revisit(Walk& walk, const Node& node, const std::optional<NodeName>& top_decision) const {
    auto it = walk.visited_ok.find(node.name);
    if (it == walk.visited_ok.end()) {
        walk.visited_ok.emplace(node.name, top_decision);
        return;
    }
    // Sibling branches of the same top decision never run together. Without
    // a common decision the node would run once per path.
    const std::optional<NodeName>& previous = it->second;
    if (!previous.has_value() || !top_decision.has_value() || *previous != *top_decision) {
        throw WorkflowException(ErrorCode::ILLEGAL_NODE_REVISIT,
                                "Node '" + node.name + "' would execute more than once at runtime");
    }
}

void ForkJoinValidator::visit_fork(Walk& walk, const Node& node, bool reachable_cleanly,
                                   const std::optional<NodeName>& top_decision) const {
    walk.fork_stack.push_back(node.name);

    // Paths may only converge immediately on a join or kill node
    const auto& paths = node.transitions;
    for (size_t i = 0; i < paths.size(); ++i) {
        const Node& a = target_node(walk.graph, node, paths[i]);
        if (a.is<JoinNode>() || a.is<KillNode>()) continue;
        for (size_t k = i + 1; k < paths.size(); ++k) {
            if (paths[i] == paths[k]) {
                throw WorkflowException(ErrorCode::FORK_DUPLICATE_TARGET,
                                        "Fork '" + node.name + "' routes to node '" + paths[i] + "' more than once");
            }
        }
    }

    for (const NodeName& name : distinct_targets(node)) {
        visit(walk, target_node(walk.graph, node, name), reachable_cleanly, top_decision);
    }

    walk.fork_stack.pop_back();
    if (!walk.join_stack.empty()) {
        walk.join_stack.pop_back();
    }
}

void ForkJoinValidator::visit_join(Walk& walk, const Node& node, bool reachable_cleanly,
                                   const std::optional<NodeName>& top_decision) const {
    if (walk.fork_stack.empty()) {
        throw WorkflowException(ErrorCode::JOIN_WITHOUT_FORK,
                                "Join '" + node.name + "' has no matching fork");
    }
    if (walk.fork_stack.size() > walk.join_stack.size() &&
        (walk.join_stack.empty() || walk.join_stack.back() != node.name)) {
        walk.join_stack.push_back(node.name);
    }
    if (walk.join_stack.empty() || walk.join_stack.back() != node.name) {
        const std::string expected = walk.join_stack.empty() ? std::string("<none>") : walk.join_stack.back();
        throw WorkflowException(ErrorCode::JOIN_FORK_MISMATCH,
                                "Fork '" + walk.fork_stack.back() + "' is joined by '" + node.name +
                                    "' but expected join '" + expected + "'");
    }

    walk.join_stack.pop_back();
    const NodeName current_fork = walk.fork_stack.back();
    walk.fork_stack.pop_back();

    const Node& next = transition(walk.graph, node, 0);
    // Every fork path walks through the join again; only the first pass
    // continues as a clean path
    if (!reachable_cleanly || walk.visited_joins.count(node.name) > 0) {
        visit(walk, next, false, top_decision);
    } else {
        walk.visited_joins.insert(node.name);
        visit(walk, next, true, top_decision);
    }

    walk.fork_stack.push_back(current_fork);
    walk.join_stack.push_back(node.name);
}

} // namespace liteflow
