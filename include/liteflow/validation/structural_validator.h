#ifndef LITEFLOW_VALIDATION_STRUCTURAL_VALIDATOR_H
#define LITEFLOW_VALIDATION_STRUCTURAL_VALIDATOR_H

#include "liteflow/actions/registry.h"
#include "liteflow/core/nodes.h"
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace liteflow {

// Fork and join nodes reachable from start, in order of first visit
struct TraversalReport {
    std::vector<NodeName> forks;
    std::vector<NodeName> joins;
};

// Depth-first walk from the start node proving that every transition
// resolves, that no cycle is reachable, that node names are legal and that
// every action type is supported. Linear in nodes + transitions.
class StructuralValidator {
public:
    explicit StructuralValidator(const ActionTypeRegistry& registry, size_t max_depth = 4096);

    // Throws INVALID_IDENTIFIER, UNSUPPORTED_ACTION_TYPE, DANGLING_TRANSITION,
    // CYCLE_DETECTED, XML_PARSE_FAILURE or TRAVERSAL_TOO_DEEP
    TraversalReport validate(const WorkflowGraph& graph) const;

private:
    enum class VisitStatus : uint8_t { VISITING, VISITED };

    // State of one validate() call
    struct Walk {
        const WorkflowGraph& graph;
        std::unordered_map<NodeName, VisitStatus> traversed;
        std::vector<NodeName> path;
        TraversalReport report;
    };

    void visit(Walk& walk, const Node& node) const;
    void check_action(const Node& node) const;

    const ActionTypeRegistry& registry_;
    size_t max_depth_;
};

} // namespace liteflow

#endif // LITEFLOW_VALIDATION_STRUCTURAL_VALIDATOR_H
