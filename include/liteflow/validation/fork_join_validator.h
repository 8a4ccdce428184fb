#ifndef LITEFLOW_VALIDATION_FORK_JOIN_VALIDATOR_H
#define LITEFLOW_VALIDATION_FORK_JOIN_VALIDATOR_H

#include "liteflow/core/nodes.h"
#include "liteflow/validation/structural_validator.h"
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace liteflow {

// Second walk over a structurally valid graph. Proves that every fork is
// closed by its own join, that parallel branches do not end the workflow,
// and that no node can run more than once because several ok-paths lead to
// it outside a common decision.
//
// A node may be reached repeatedly along error transitions (only one of ok
// and error is ever taken), through sibling branches of one decision (only
// one branch runs), and downstream of a join that was already walked once
// (the walk re-enters the join from every fork path).
class ForkJoinValidator {
public:
    // Paths through decision diamonds multiply, so besides the depth the
    // total number of node visits of one walk is capped by `max_visits`.
    explicit ForkJoinValidator(size_t max_depth = 4096, size_t max_visits = 100000);

    // `report` comes from StructuralValidator::validate on the same graph.
    // Throws UNBALANCED_FORK_JOIN_COUNT, FORK_DUPLICATE_TARGET,
    // JOIN_WITHOUT_FORK, JOIN_FORK_MISMATCH, ILLEGAL_NODE_REVISIT,
    // PARALLEL_BRANCH_UNJOINED_END, CYCLE_DETECTED, TRAVERSAL_TOO_DEEP or
    // TRAVERSAL_BUDGET_EXCEEDED
    void validate(const WorkflowGraph& graph, const TraversalReport& report) const;

private:
    // State of one validate() call
    struct Walk {
        const WorkflowGraph& graph;
        std::vector<NodeName> path;
        std::vector<NodeName> fork_stack;
        std::vector<NodeName> join_stack;
        std::unordered_map<NodeName, std::optional<NodeName>> visited_ok; // node -> top decision ancestor
        std::unordered_set<NodeName> visited_joins;
        size_t visits = 0;
    };

    void visit(Walk& walk, const Node& node, bool reachable_cleanly, const std::optional<NodeName>& top_decision) const;
    void check_revisit(Walk& walk, const Node& node, const std::optional<NodeName>& top_decision) const;
    void visit_fork(Walk& walk, const Node& node, bool reachable_cleanly, const std::optional<NodeName>& top_decision) const;
    void visit_join(Walk& walk, const Node& node, bool reachable_cleanly, const std::optional<NodeName>& top_decision) const;

    size_t max_depth_;
    size_t max_visits_;
};

} // namespace liteflow

#endif // LITEFLOW_VALIDATION_FORK_JOIN_VALIDATOR_H
