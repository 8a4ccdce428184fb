// tests/test_parser.cpp
#include <catch2/catch_test_macros.hpp>
#include "liteflow/core/parser.h"
#include "liteflow/xml/schema_validator.h"
#include "test_helpers.h"
#include <filesystem>
#include <fstream>

using namespace liteflow;
using liteflow::testing::thrown_code;

namespace {

SiteConfig test_site() {
    SiteConfig site;
    site.default_name_node = "hdfs://nn:8020";
    site.default_job_tracker = "jt:8032";
    return site;
}

const std::string FORK_JOIN = R"(
<workflow-app name="fork-join">
    <start to="split"/>
    <fork name="split">
        <path start="a"/>
        <path start="b"/>
    </fork>
    <action name="a">
        <map-reduce/>
        <ok to="merge"/>
        <error to="fail"/>
    </action>
    <action name="b">
        <map-reduce/>
        <ok to="merge"/>
        <error to="fail"/>
    </action>
    <join name="merge" to="done"/>
    <kill name="fail"><message>failed</message></kill>
    <end name="done"/>
</workflow-app>)";

// Fork whose second branch never joins
const std::string UNBALANCED = R"(
<workflow-app name="unbalanced">
    <start to="split"/>
    <fork name="split">
        <path start="a"/>
        <path start="b"/>
    </fork>
    <action name="a"><shell/><ok to="done"/><error to="done"/></action>
    <action name="b"><shell/><ok to="done"/><error to="done"/></action>
    <end name="done"/>
</workflow-app>)";

} // namespace

TEST_CASE("Parses a minimal fork/join workflow", "[parser]") {
    ActionTypeRegistry registry;
    WorkflowParser parser(registry, test_site());
    Configuration job_conf;

    auto parsed = parser.validate_and_parse(FORK_JOIN, job_conf);

    REQUIRE(parsed.graph != nullptr);
    REQUIRE(parsed.fork_join_validated);
    REQUIRE(parsed.graph->app_name() == "fork-join");
    REQUIRE(parsed.graph->size() == 7);
    REQUIRE(parsed.report.forks == std::vector<NodeName>{"split"});
    REQUIRE(parsed.report.joins == std::vector<NodeName>{"merge"});
    REQUIRE(parsed.graph->find("split")->transitions == std::vector<NodeName>{"a", "b"});

    // Defaults were applied to every action
    const auto& conf = parsed.graph->find("a")->as<ActionNode>().conf;
    REQUIRE(conf.find("hdfs://nn:8020") != std::string::npos);
    REQUIRE(conf.find("jt:8032") != std::string::npos);
}

TEST_CASE("Parses start, one action, kill and end", "[parser]") {
    ActionTypeRegistry registry;
    WorkflowParser parser(registry, test_site());
    Configuration job_conf;

    auto parsed = parser.validate_and_parse(R"(
<workflow-app name="single" xmlns="uri:liteflow:workflow:0.5">
    <start to="work"/>
    <action name="work">
        <java><main-class>com.example.Main</main-class></java>
        <ok to="end"/>
        <error to="kill"/>
    </action>
    <kill name="kill"><message>boom</message></kill>
    <end name="end"/>
</workflow-app>)", job_conf);

    const WorkflowGraph& graph = *parsed.graph;
    REQUIRE(graph.start().transitions == std::vector<NodeName>{"work"});
    REQUIRE(graph.find("work")->transitions == std::vector<NodeName>{"end", "kill"});
    REQUIRE(graph.find("kill")->is<KillNode>());
    REQUIRE(graph.find("end")->is<EndNode>());
    REQUIRE(parsed.report.forks.empty());
    REQUIRE(parsed.report.joins.empty());
    REQUIRE_FALSE(parsed.global_defaults.has_value());
}

TEST_CASE("Fork/join validation can be switched off", "[parser]") {
    ActionTypeRegistry registry;

    SECTION("Enabled by default") {
        WorkflowParser parser(registry, test_site());
        Configuration job_conf;
        REQUIRE(thrown_code([&] { parser.validate_and_parse(UNBALANCED, job_conf); }) == "UNBALANCED_FORK_JOIN_COUNT");
    }

    SECTION("Per job") {
        WorkflowParser parser(registry, test_site());
        Configuration job_conf;
        job_conf.set(WF_VALIDATE_FORK_JOIN, "false");
        auto parsed = parser.validate_and_parse(UNBALANCED, job_conf);
        REQUIRE_FALSE(parsed.fork_join_validated);
        REQUIRE(parsed.report.forks.size() == 1);
    }

    SECTION("Per site") {
        SiteConfig site = test_site();
        site.validate_fork_join = false;
        WorkflowParser parser(registry, site);
        Configuration job_conf;
        job_conf.set(WF_VALIDATE_FORK_JOIN, "true");
        REQUIRE_FALSE(parser.validate_and_parse(UNBALANCED, job_conf).fork_join_validated);
    }
}

TEST_CASE("Parameters are verified before building", "[parser][parameters]") {
    ActionTypeRegistry registry;
    WorkflowParser parser(registry, test_site());

    const std::string xml = R"(
<workflow-app name="params">
    <parameters>
        <property><name>input</name></property>
        <property><name>output</name></property>
        <property><name>retries</name><value>2</value></property>
    </parameters>
    <start to="a"/>
    <action name="a" retry-max="${retries}">
        <shell/>
        <ok to="done"/>
        <error to="done"/>
    </action>
    <end name="done"/>
</workflow-app>)";

    SECTION("Missing parameters are listed together") {
        Configuration job_conf;
        try {
            parser.validate_and_parse(xml, job_conf);
            FAIL("missing parameters not reported");
        } catch (const WorkflowException& e) {
            REQUIRE(e.code() == ErrorCode::PARAMETER_VERIFICATION_FAILURE);
            REQUIRE(e.detail().find("input, output") != std::string::npos);
        }
    }

    SECTION("Defaults are copied into the job configuration") {
        Configuration job_conf;
        job_conf.set("input", "/in");
        job_conf.set("output", "/out");
        auto parsed = parser.validate_and_parse(xml, job_conf);

        REQUIRE(job_conf.get("retries") == std::optional<std::string>("2"));
        REQUIRE(parsed.graph->find("a")->as<ActionNode>().retry_max == std::optional<std::string>("2"));
    }

    SECTION("Job values win over declared defaults") {
        Configuration job_conf;
        job_conf.set("input", "/in");
        job_conf.set("output", "/out");
        job_conf.set("retries", "5");
        auto parsed = parser.validate_and_parse(xml, job_conf);

        REQUIRE(parsed.graph->find("a")->as<ActionNode>().retry_max == std::optional<std::string>("5"));
    }
}

TEST_CASE("Surfaces the first fault of each pass", "[parser]") {
    ActionTypeRegistry registry;
    WorkflowParser parser(registry, test_site());
    Configuration job_conf;

    REQUIRE(thrown_code([&] { parser.validate_and_parse("<workflow-app", job_conf); }) == "XML_PARSE_FAILURE");
    REQUIRE(thrown_code([&] {
        parser.validate_and_parse(R"(<workflow-app name="wf"><start to="nowhere"/><end name="done"/></workflow-app>)", job_conf);
    }) == "DANGLING_TRANSITION");
    REQUIRE(thrown_code([&] {
        parser.validate_and_parse(R"(<workflow-app name="wf"><start to="a"/>
            <action name="a"><shell/><ok to="a"/><error to="done"/></action>
            <end name="done"/></workflow-app>)", job_conf);
    }) == "CYCLE_DETECTED");
}

TEST_CASE("Uses the configured traversal depth", "[parser]") {
    ActionTypeRegistry registry;
    SiteConfig site = test_site();
    site.max_traversal_depth = 1;
    WorkflowParser parser(registry, site);
    Configuration job_conf;

    REQUIRE(thrown_code([&] { parser.validate_and_parse(FORK_JOIN, job_conf); }) == "TRAVERSAL_TOO_DEEP");
}

TEST_CASE("Uses the configured visit budget for fork/join validation", "[parser]") {
    ActionTypeRegistry registry;
    SiteConfig site = test_site();
    site.max_traversal_visits = 3;
    WorkflowParser parser(registry, site);

    Configuration job_conf;
    REQUIRE(thrown_code([&] { parser.validate_and_parse(FORK_JOIN, job_conf); }) == "TRAVERSAL_BUDGET_EXCEEDED");

    // Only the fork/join walk is budgeted
    Configuration unchecked_conf;
    unchecked_conf.set(WF_VALIDATE_FORK_JOIN, "false");
    REQUIRE_NOTHROW(parser.validate_and_parse(FORK_JOIN, unchecked_conf));
}

TEST_CASE("Reads definitions from files", "[parser]") {
    ActionTypeRegistry registry;
    WorkflowParser parser(registry, test_site());
    Configuration job_conf;

    auto path = std::filesystem::temp_directory_path() / "liteflow_test_parser_workflow.xml";
    {
        std::ofstream out(path);
        out << FORK_JOIN;
    }
    auto parsed = parser.validate_and_parse_file(path.string(), job_conf);
    REQUIRE(parsed.graph->app_name() == "fork-join");
    std::filesystem::remove(path);

    REQUIRE(thrown_code([&] { parser.validate_and_parse_file("/nonexistent/workflow.xml", job_conf); }) == "IO_ERROR");
}

TEST_CASE("Checks the schema before parsing", "[parser][schema]") {
    ActionTypeRegistry registry;
    auto schema = std::make_shared<XsdSchemaValidator>(std::string(LITEFLOW_TEST_DATA_DIR) + "/workflow.xsd");
    WorkflowParser parser(registry, test_site(), schema);
    Configuration job_conf;

    REQUIRE_NOTHROW(parser.validate_and_parse(FORK_JOIN, job_conf));
    REQUIRE(thrown_code([&] {
        parser.validate_and_parse(R"(<workflow-app><start to="done"/><end name="done"/></workflow-app>)", job_conf);
    }) == "SCHEMA_VIOLATION");

    REQUIRE(thrown_code([] { XsdSchemaValidator("/nonexistent/workflow.xsd"); }) == "IO_ERROR");
}

TEST_CASE("One parser serves many parses", "[parser]") {
    ActionTypeRegistry registry;
    const WorkflowParser parser(registry, test_site());

    Configuration first_conf;
    Configuration second_conf;
    auto first = parser.validate_and_parse(FORK_JOIN, first_conf);
    auto second = parser.validate_and_parse(FORK_JOIN, second_conf);

    REQUIRE(first.graph != second.graph);
    REQUIRE(first.report.forks == second.report.forks);
}
