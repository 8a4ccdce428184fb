// tests/test_structural_validator.cpp
#include <catch2/catch_test_macros.hpp>
#include "liteflow/actions/registry.h"
#include "liteflow/validation/structural_validator.h"
#include "test_helpers.h"

using namespace liteflow;
using liteflow::testing::step;
using liteflow::testing::thrown_code;

namespace {

WorkflowGraph linear_graph() {
    WorkflowGraph graph("linear", "");
    graph.add_node(Node::start("a"));
    graph.add_node(step("a", "b"));
    graph.add_node(step("b", "done"));
    graph.add_node(Node::kill("fail", "failed"));
    graph.add_node(Node::end("done"));
    return graph;
}

} // namespace

TEST_CASE("Accepts a linear workflow", "[structural]") {
    ActionTypeRegistry registry;
    StructuralValidator validator(registry);
    auto graph = linear_graph();

    auto report = validator.validate(graph);
    REQUIRE(report.forks.empty());
    REQUIRE(report.joins.empty());
}

TEST_CASE("Reports forks and joins in first-visit order", "[structural]") {
    ActionTypeRegistry registry;
    StructuralValidator validator(registry);

    WorkflowGraph graph("nested", "");
    graph.add_node(Node::start("outer"));
    graph.add_node(Node::fork("outer", {"inner", "c"}));
    graph.add_node(Node::fork("inner", {"a", "b"}));
    graph.add_node(step("a", "inner-join"));
    graph.add_node(step("b", "inner-join"));
    graph.add_node(Node::join("inner-join", "outer-join"));
    graph.add_node(step("c", "outer-join"));
    graph.add_node(Node::join("outer-join", "done"));
    graph.add_node(Node::kill("fail", ""));
    graph.add_node(Node::end("done"));

    auto report = validator.validate(graph);
    REQUIRE(report.forks == std::vector<NodeName>{"outer", "inner"});
    REQUIRE(report.joins == std::vector<NodeName>{"inner-join", "outer-join"});
}

TEST_CASE("Rejects a transition to an undefined node", "[structural]") {
    ActionTypeRegistry registry;
    StructuralValidator validator(registry);

    WorkflowGraph graph("dangling", "");
    graph.add_node(Node::start("a"));
    graph.add_node(step("a", "missing"));
    graph.add_node(Node::kill("fail", ""));

    REQUIRE(thrown_code([&] { validator.validate(graph); }) == "DANGLING_TRANSITION");
}

TEST_CASE("Rejects a reachable cycle and names its path", "[structural]") {
    ActionTypeRegistry registry;
    StructuralValidator validator(registry);

    WorkflowGraph graph("loop", "");
    graph.add_node(Node::start("a"));
    graph.add_node(step("a", "b"));
    graph.add_node(step("b", "a"));
    graph.add_node(Node::kill("fail", ""));

    try {
        validator.validate(graph);
        FAIL("cycle not detected");
    } catch (const WorkflowException& e) {
        REQUIRE(e.code() == ErrorCode::CYCLE_DETECTED);
        REQUIRE(e.detail().find("a -> b -> a") != std::string::npos);
    }
}

TEST_CASE("A node shared by two branches is not a cycle", "[structural]") {
    ActionTypeRegistry registry;
    StructuralValidator validator(registry);

    WorkflowGraph graph("diamond", "");
    graph.add_node(Node::start("pick"));
    graph.add_node(Node::decision("pick", {"left", "right"}));
    graph.add_node(step("left", "shared"));
    graph.add_node(step("right", "shared"));
    graph.add_node(step("shared", "done"));
    graph.add_node(Node::kill("fail", ""));
    graph.add_node(Node::end("done"));

    REQUIRE_NOTHROW(validator.validate(graph));
}

TEST_CASE("Checks node names along reachable paths", "[structural]") {
    ActionTypeRegistry registry;
    StructuralValidator validator(registry);

    SECTION("Illegal characters") {
        WorkflowGraph graph("names", "");
        graph.add_node(Node::start("1st step"));
        graph.add_node(step("1st step", "done"));
        graph.add_node(Node::kill("fail", ""));
        graph.add_node(Node::end("done"));
        REQUIRE(thrown_code([&] { validator.validate(graph); }) == "INVALID_IDENTIFIER");
    }

    SECTION("Too long") {
        const std::string name(MAX_NODE_NAME_LENGTH + 1, 'x');
        WorkflowGraph graph("names", "");
        graph.add_node(Node::start(name));
        graph.add_node(step(name, "done"));
        graph.add_node(Node::kill("fail", ""));
        graph.add_node(Node::end("done"));
        REQUIRE(thrown_code([&] { validator.validate(graph); }) == "INVALID_IDENTIFIER");
    }

    SECTION("Unreachable nodes are not inspected") {
        auto graph = linear_graph();
        graph.add_node(Node::end("not reachable"));
        REQUIRE_NOTHROW(validator.validate(graph));
    }
}

TEST_CASE("Rejects action types missing from the registry", "[structural]") {
    ActionTypeRegistry registry;
    registry.unregister_action("map-reduce");
    StructuralValidator validator(registry);

    auto graph = linear_graph();
    REQUIRE(thrown_code([&] { validator.validate(graph); }) == "UNSUPPORTED_ACTION_TYPE");
}

TEST_CASE("Stops at the configured depth", "[structural]") {
    ActionTypeRegistry registry;
    StructuralValidator validator(registry, 2);

    auto graph = linear_graph();
    REQUIRE(thrown_code([&] { validator.validate(graph); }) == "TRAVERSAL_TOO_DEEP");
}

TEST_CASE("A graph without start is rejected", "[structural]") {
    ActionTypeRegistry registry;
    StructuralValidator validator(registry);

    WorkflowGraph graph("headless", "");
    graph.add_node(Node::end("done"));
    REQUIRE(thrown_code([&] { validator.validate(graph); }) == "MISSING_START_NODE");
}
