/**
 * @file test_end_to_end.cpp
 * @brief Runs feature files against implementation files through real shell processes
 *
 * Scope:
 *  - Discovery, catalog compilation, resolution, execution and reporting together
 *  - Output chaining and capture variables as seen by real scripts
 *  - Failure and undefined-step cascades
 *  - Deterministic JSON output across repeated runs
 */

#include <catch2/catch_test_macros.hpp>

#include "ea_gherkin/engine.hpp"
#include "ea_gherkin/feature_parser.hpp"
#include "ea_gherkin/implementation_catalog.hpp"
#include "ea_gherkin/report_writer.hpp"
#include "ea_gherkin/shell_bridge.hpp"
#include "ea_gherkin/source_provider.hpp"
#include "ea_gherkin/step_resolver.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

using ea::gherkin::DirectorySourceProvider;
using ea::gherkin::Engine;
using ea::gherkin::FeatureParser;
using ea::gherkin::ImplementationCatalog;
using ea::gherkin::ReportWriter;
using ea::gherkin::RunResult;
using ea::gherkin::StepResolver;
using ea::gherkin::StepStatus;
using ea::gherkin::shell_bridge::Session;

namespace fs = std::filesystem;

namespace {

const char* kCounterSteps =
    "Counter step implementations.\n"
    "\n"
    "IMPLEMENTS a fresh counter\n"
    "#!/bin/sh\n"
    "echo 0\n"
    "\n"
    "IMPLEMENTS I increment the counter\n"
    "echo $((PREVIOUS_STEP_STDOUT + 1))\n"
    "\n"
    "IMPLEMENTS I add (\\d+) to the counter\n"
    "echo $((PREVIOUS_STEP_STDOUT + MATCH_1))\n"
    "\n"
    "IMPLEMENTS count should be (\\d+)\n"
    "test \"$PREVIOUS_STEP_STDOUT\" = \"$MATCH_1\"\n";

const char* kMiscSteps =
    "IMPLEMENTS the value 7\n"
    "echo 7\n"
    "\n"
    "IMPLEMENTS the previous output is 7\n"
    "test \"$PREVIOUS_STEP_STDOUT\" = \"7\"\n"
    "\n"
    "IMPLEMENTS the step fails with \"([^\"]*)\"\n"
    "echo \"$MATCH_1\" >&2\n"
    "exit 1\n";

struct Workspace {
    fs::path root;

    Workspace() {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        root = fs::temp_directory_path() / ("ea_gherkin_e2e_" + std::to_string(stamp));
        fs::create_directories(root / "implements");
        write(root / "implements" / "counter.gherkin", kCounterSteps);
        write(root / "implements" / "misc.gherkin", kMiscSteps);
    }
    ~Workspace() {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    static void write(const fs::path& path, const std::string& content) {
        std::ofstream out(path, std::ios::binary);
        out << content;
    }

    fs::path feature(const std::string& name, const std::string& content) const {
        const auto path = root / name;
        write(path, content);
        return path;
    }

    RunResult run(const fs::path& feature_file) const {
        const auto catalog = ImplementationCatalog::compile(DirectorySourceProvider(root / "implements"));
        const StepResolver resolver(catalog);
        Session session(Session::Config{.interpreter = "/bin/sh", .timeout_sec = 10});
        const auto feature = FeatureParser{}.load(feature_file);
        return Engine(resolver, session).run(feature);
    }
};

} // namespace

TEST_CASE("A counter feature passes end to end", "[gherkin][e2e][process]")
{
    Workspace ws;
    const auto path = ws.feature("counter.feature",
                                 "Feature: Counter\n"
                                 "  Background:\n"
                                 "    Given a fresh counter\n"
                                 "\n"
                                 "  Scenario: Increment once\n"
                                 "    When I increment the counter\n"
                                 "    Then count should be 1\n"
                                 "\n"
                                 "  Scenario: Add a number\n"
                                 "    When I add 5 to the counter\n"
                                 "    And I increment the counter\n"
                                 "    Then count should be 6\n");

    const auto result = ws.run(path);

    CHECK(result.summary.scenarios.total == 2);
    CHECK(result.summary.scenarios.passed == 2);
    CHECK(result.summary.steps.total == 7);
    CHECK(result.summary.steps.passed == 7);
    CHECK(ea::gherkin::exit_code(result) == 0);
    CHECK(result.scenarios[1].steps[2].output->stdout_text == "6\n");
}

TEST_CASE("Output of one step is visible to the next", "[gherkin][e2e][process]")
{
    Workspace ws;
    const auto path = ws.feature("chain.feature",
                                 "Feature: Chaining\n"
                                 "  Scenario: Seven\n"
                                 "    Given the value 7\n"
                                 "    Then the previous output is 7\n"
                                 "\n"
                                 "  Scenario: Fresh start\n"
                                 "    Then the previous output is 7\n");

    const auto result = ws.run(path);

    CHECK(result.scenarios[0].status == StepStatus::Passed);
    // Chained output does not carry over into the next scenario.
    CHECK(result.scenarios[1].status == StepStatus::Failed);
    CHECK(result.summary.scenarios.passed == 1);
    CHECK(result.summary.scenarios.failed == 1);
}

TEST_CASE("A failing step stops its scenario but not the run", "[gherkin][e2e][process]")
{
    Workspace ws;
    const auto path = ws.feature("failing.feature",
                                 "Feature: Failures\n"
                                 "  Scenario: Broken\n"
                                 "    Given a fresh counter\n"
                                 "    When the step fails with \"disk full\"\n"
                                 "    Then count should be 0\n"
                                 "\n"
                                 "  Scenario: Still runs\n"
                                 "    Given a fresh counter\n"
                                 "    Then count should be 0\n");

    const auto result = ws.run(path);

    const auto& broken = result.scenarios.at(0);
    CHECK(broken.status == StepStatus::Failed);
    REQUIRE(broken.steps[1].output.has_value());
    CHECK(broken.steps[1].output->exit_code == 1);
    CHECK(broken.steps[1].output->stderr_text == "disk full\n");
    CHECK(broken.steps[2].status == StepStatus::Skipped);

    CHECK(result.scenarios.at(1).status == StepStatus::Passed);
    CHECK(result.summary.steps.passed == 3);
    CHECK(result.summary.steps.failed == 1);
    CHECK(result.summary.steps.skipped == 1);
    CHECK(ea::gherkin::exit_code(result) == 1);
}

TEST_CASE("Undefined steps are reported and skip the rest", "[gherkin][e2e][process]")
{
    Workspace ws;
    const auto path = ws.feature("undefined.feature",
                                 "Feature: Gaps\n"
                                 "  Scenario: Missing\n"
                                 "    Given a fresh counter\n"
                                 "    When I multiply the counter by 3\n"
                                 "    Then count should be 0\n");

    const auto result = ws.run(path);

    const auto& scenario = result.scenarios.at(0);
    CHECK(scenario.status == StepStatus::Undefined);
    CHECK(scenario.steps[1].status == StepStatus::Undefined);
    CHECK(scenario.steps[2].status == StepStatus::Skipped);
    CHECK(result.summary.scenarios.undefined == 1);
    CHECK(result.summary.scenarios.failed == 1);
    CHECK(ea::gherkin::exit_code(result) == 1);
}

TEST_CASE("Repeated runs produce byte-identical JSON", "[gherkin][e2e][process]")
{
    Workspace ws;
    const auto path = ws.feature("repeat.feature",
                                 "Feature: Repeat\n"
                                 "  Scenario: Same every time\n"
                                 "    Given a fresh counter\n"
                                 "    When I add 2 to the counter\n"
                                 "    Then count should be 3\n");

    const ReportWriter writer;
    const auto first = writer.render_json(ws.run(path));
    const auto second = writer.render_json(ws.run(path));

    CHECK(first == second);
    const auto report = nlohmann::json::parse(first);
    CHECK(report["feature"]["file"] == path.string());
    CHECK(report["scenarios"][0]["status"] == "failed");
    CHECK(report["scenarios"][0]["steps"][2]["implementation"] ==
          (ws.root / "implements" / "counter.gherkin").string() + ":13");
}
