// tests/test_graph_builder.cpp
#include <catch2/catch_test_macros.hpp>
#include "liteflow/core/graph_builder.h"
#include "liteflow/xml/xml_utils.h"
#include "test_helpers.h"

using namespace liteflow;
using liteflow::testing::thrown_code;

namespace {

BuildResult build(const std::string& xml, const Configuration& job_conf = Configuration()) {
    XmlDocument doc = XmlDocument::parse(xml);
    return GraphBuilder().build(doc.root(), xml, job_conf);
}

} // namespace

TEST_CASE("Builds every node kind", "[builder]") {
    std::string xml = R"(
<workflow-app name="all-kinds" xmlns="uri:liteflow:workflow:0.5">
    <start to="split"/>
    <fork name="split">
        <path start="load"/>
        <path start="copy"/>
    </fork>
    <action name="load" cred="hcat">
        <map-reduce><prepare/></map-reduce>
        <ok to="merge"/>
        <error to="fail"/>
    </action>
    <action name="copy">
        <fs><mkdir path="/tmp/x"/></fs>
        <ok to="merge"/>
        <error to="fail"/>
    </action>
    <join name="merge" to="route"/>
    <decision name="route">
        <switch>
            <case to="done">${fs:exists('/tmp/x')}</case>
            <case to="fail">${false}</case>
            <default to="done"/>
        </switch>
    </decision>
    <kill name="fail">
        <message>Stopped at [${wf:lastErrorNode()}]</message>
    </kill>
    <end name="done"/>
</workflow-app>)";

    auto result = build(xml);
    const WorkflowGraph& graph = result.graph;

    REQUIRE(graph.app_name() == "all-kinds");
    REQUIRE(graph.definition() == xml);
    REQUIRE(graph.size() == 8);
    REQUIRE_FALSE(result.global_section.has_value());

    const Node& start = graph.start();
    REQUIRE(start.name == START_NODE_NAME);
    REQUIRE(start.transitions == std::vector<NodeName>{"split"});

    REQUIRE(graph.find("split")->transitions == std::vector<NodeName>{"load", "copy"});
    REQUIRE(graph.find("merge")->transitions == std::vector<NodeName>{"route"});

    const Node* load = graph.find("load");
    REQUIRE(load->type() == NodeType::ACTION);
    REQUIRE(load->transitions == std::vector<NodeName>{"merge", "fail"});
    REQUIRE(load->as<ActionNode>().action_type == "map-reduce");
    REQUIRE(load->as<ActionNode>().cred == std::optional<std::string>("hcat"));
    REQUIRE(load->as<ActionNode>().conf.find("<prepare/>") != std::string::npos);

    // Cases in document order, default last
    const Node* route = graph.find("route");
    REQUIRE(route->is<DecisionNode>());
    REQUIRE(route->transitions == std::vector<NodeName>{"done", "fail", "done"});

    REQUIRE(graph.find("fail")->as<KillNode>().message == "Stopped at [${wf:lastErrorNode()}]");
    REQUIRE(graph.find("done")->is<EndNode>());

    REQUIRE(graph.node_order() ==
            std::vector<NodeName>{START_NODE_NAME, "split", "load", "copy", "merge", "route", "fail", "done"});
}

TEST_CASE("Keeps the global section for defaults resolution", "[builder]") {
    auto result = build(R"(
<workflow-app name="wf">
    <global>
        <job-tracker>jt:8032</job-tracker>
    </global>
    <start to="done"/>
    <end name="done"/>
</workflow-app>)");

    REQUIRE(result.global_section.has_value());
    REQUIRE(result.global_section->find("jt:8032") != std::string::npos);
}

TEST_CASE("Resolves retry attributes against the job configuration", "[builder][expression]") {
    Configuration job_conf;
    job_conf.set("retries", "4");
    job_conf.set("wf.interval", "10");

    auto result = build(R"(
<workflow-app name="wf">
    <start to="a"/>
    <action name="a" retry-max="${retries}" retry-interval="${wf.interval}">
        <shell/>
        <ok to="done"/>
        <error to="done"/>
    </action>
    <end name="done"/>
</workflow-app>)", job_conf);

    const auto& action = result.graph.find("a")->as<ActionNode>();
    REQUIRE(action.retry_max == std::optional<std::string>("4"));
    REQUIRE(action.retry_interval == std::optional<std::string>("10"));

    SECTION("Unknown variables fail") {
        REQUIRE(thrown_code([] {
            build(R"(
<workflow-app name="wf">
    <start to="a"/>
    <action name="a" retry-max="${undefined_retries}">
        <shell/>
        <ok to="done"/>
        <error to="done"/>
    </action>
    <end name="done"/>
</workflow-app>)");
        }) == "EXPRESSION_RESOLUTION_FAILURE");
    }
}

TEST_CASE("Rejects malformed definitions", "[builder]") {
    SECTION("Unknown element") {
        REQUIRE(thrown_code([] {
            build(R"(<workflow-app name="wf"><start to="done"/><loop name="x"/><end name="done"/></workflow-app>)");
        }) == "UNKNOWN_ELEMENT");
    }

    SECTION("No start") {
        REQUIRE(thrown_code([] {
            build(R"(<workflow-app name="wf"><end name="done"/></workflow-app>)");
        }) == "MISSING_START_NODE");
    }

    SECTION("Duplicate name") {
        REQUIRE(thrown_code([] {
            build(R"(<workflow-app name="wf"><start to="done"/><end name="done"/><kill name="done"/></workflow-app>)");
        }) == "DUPLICATE_NODE");
    }

    SECTION("Two start elements") {
        REQUIRE(thrown_code([] {
            build(R"(<workflow-app name="wf"><start to="done"/><start to="done"/><end name="done"/></workflow-app>)");
        }) == "DUPLICATE_NODE");
    }

    SECTION("Action without error transition") {
        REQUIRE(thrown_code([] {
            build(R"(<workflow-app name="wf"><start to="a"/>
                <action name="a"><shell/><ok to="done"/></action><end name="done"/></workflow-app>)");
        }) == "MALFORMED_DEFINITION");
    }

    SECTION("Action with two action types") {
        REQUIRE(thrown_code([] {
            build(R"(<workflow-app name="wf"><start to="a"/>
                <action name="a"><shell/><pig/><ok to="done"/><error to="done"/></action>
                <end name="done"/></workflow-app>)");
        }) == "MALFORMED_DEFINITION");
    }

    SECTION("Decision without default") {
        REQUIRE(thrown_code([] {
            build(R"(<workflow-app name="wf"><start to="d"/>
                <decision name="d"><switch><case to="done">${true}</case></switch></decision>
                <end name="done"/></workflow-app>)");
        }) == "MALFORMED_DEFINITION");
    }

    SECTION("Fork without paths") {
        REQUIRE(thrown_code([] {
            build(R"(<workflow-app name="wf"><start to="f"/><fork name="f"/><end name="done"/></workflow-app>)");
        }) == "MALFORMED_DEFINITION");
    }

    SECTION("End without name") {
        REQUIRE(thrown_code([] {
            build(R"(<workflow-app name="wf"><start to="done"/><end/></workflow-app>)");
        }) == "MALFORMED_DEFINITION");
    }
}

TEST_CASE("Ignores sections handled by other passes", "[builder]") {
    auto result = build(R"(
<workflow-app name="wf">
    <parameters><property><name>x</name></property></parameters>
    <credentials><credential name="hcat" type="hcat"/></credentials>
    <start to="done"/>
    <end name="done"/>
</workflow-app>)");

    REQUIRE(result.graph.size() == 2);
}
