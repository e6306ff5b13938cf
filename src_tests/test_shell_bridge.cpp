/**
 * @file test_shell_bridge.cpp
 * @brief Tests for running step scripts in a child process
 *
 * Scope:
 *  - Output capture, exit codes (including signals and timeouts)
 *  - MATCH_n / PREVIOUS_STEP_STDOUT environment and isolation from inherited values
 *  - Interpreter lookup and launch failures
 *
 * Strategy:
 *  - Uses /bin/sh so the tests run on any POSIX system.
 */

#include <catch2/catch_test_macros.hpp>

#include "ea_gherkin/errors.hpp"
#include "ea_gherkin/interpreter_locator.hpp"
#include "ea_gherkin/shell_bridge.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

using ea::gherkin::LaunchError;
using ea::gherkin::PathInterpreterLocator;
using ea::gherkin::StepInvocation;
using ea::gherkin::shell_bridge::Session;

namespace {

Session make_session(int timeout_sec = 0) {
    return Session(Session::Config{.interpreter = "/bin/sh", .timeout_sec = timeout_sec});
}

StepInvocation invocation_of(const std::string& script, std::vector<std::string> captures = {},
                             std::string previous = {}) {
    StepInvocation invocation;
    invocation.script = script;
    invocation.captures = std::move(captures);
    invocation.previous_output = std::move(previous);
    invocation.label = "test step";
    return invocation;
}

bool contains(const std::vector<std::string>& env, const std::string& entry) {
    return std::find(env.begin(), env.end(), entry) != env.end();
}

} // namespace

TEST_CASE("stdout, stderr and exit code are captured", "[gherkin][shell][process]")
{
    auto session = make_session();
    const auto result = session.execute(invocation_of("echo out\necho err >&2\nexit 4"));

    CHECK(result.exit_code == 4);
    CHECK(result.stdout_text == "out\n");
    CHECK(result.stderr_text == "err\n");
    CHECK_FALSE(result.capture_failed);
    CHECK_FALSE(result.succeeded());
}

TEST_CASE("Captures and previous output reach the script environment", "[gherkin][shell][process]")
{
    auto session = make_session();
    const auto result = session.execute(
        invocation_of("printf '%s|%s|%s' \"$MATCH_1\" \"$MATCH_2\" \"$PREVIOUS_STEP_STDOUT\"", {"5", "a b"}, "7"));

    CHECK(result.exit_code == 0);
    CHECK(result.stdout_text == "5|a b|7");
    CHECK(result.succeeded());
}

TEST_CASE("PREVIOUS_STEP_STDOUT is always defined", "[gherkin][shell][process]")
{
    auto session = make_session();
    const auto result = session.execute(invocation_of("test \"${PREVIOUS_STEP_STDOUT+set}\" = set"));
    CHECK(result.exit_code == 0);
}

TEST_CASE("Inherited step variables do not leak into the child", "[gherkin][shell]")
{
    ::setenv("MATCH_9", "stale", 1);
    ::setenv("PREVIOUS_STEP_STDOUT", "stale", 1);
    ::setenv("EA_GHERKIN_TEST_MARKER", "kept", 1);

    const auto env = Session::build_environment(invocation_of("true", {"x"}, "prev"), true);

    ::unsetenv("MATCH_9");
    ::unsetenv("PREVIOUS_STEP_STDOUT");
    ::unsetenv("EA_GHERKIN_TEST_MARKER");

    CHECK(contains(env, "EA_GHERKIN_TEST_MARKER=kept"));
    CHECK(contains(env, "MATCH_1=x"));
    CHECK(contains(env, "PREVIOUS_STEP_STDOUT=prev"));
    CHECK_FALSE(contains(env, "MATCH_9=stale"));
    CHECK_FALSE(contains(env, "PREVIOUS_STEP_STDOUT=stale"));

    const auto bare = Session::build_environment(invocation_of("true"), false);
    REQUIRE(bare.size() == 1);
    CHECK(bare[0] == "PREVIOUS_STEP_STDOUT=");
}

TEST_CASE("Empty scripts fail without spawning", "[gherkin][shell]")
{
    auto session = make_session();
    const auto result = session.execute(invocation_of("  \n"));

    CHECK(result.exit_code == 1);
    CHECK(result.stderr_text == "Empty script content");
    CHECK(result.stdout_text.empty());
}

TEST_CASE("A child killed by a signal reports 128 plus the signal", "[gherkin][shell][process]")
{
    auto session = make_session();
    const auto result = session.execute(invocation_of("kill -9 $$"));
    CHECK(result.exit_code == 137);
}

TEST_CASE("Steps exceeding the timeout are killed", "[gherkin][shell][process]")
{
    auto session = make_session(1);
    const auto result = session.execute(invocation_of("echo started\nsleep 5\necho finished"));

    CHECK(result.exit_code == 124);
    CHECK(result.stdout_text == "started\n");
    CHECK(result.stderr_text.find("Script execution timed out after 1 seconds") != std::string::npos);
}

TEST_CASE("The timeout applies after the child closes its output", "[gherkin][shell][process]")
{
    auto session = make_session(1);
    const auto result = session.execute(invocation_of("exec >&- 2>&-; sleep 5"));

    CHECK(result.exit_code == 124);
    CHECK(result.stderr_text.find("Script execution timed out after 1 seconds") != std::string::npos);
}

TEST_CASE("A missing interpreter is a launch error","[gherkin][shell][process]")
{
    Session session(Session::Config{.interpreter = "/nonexistent/bin/sh"});
    CHECK_THROWS_AS(session.execute(invocation_of("echo hi")), LaunchError);
}

TEST_CASE("PathInterpreterLocator resolves through PATH", "[gherkin][shell]")
{
    const auto sh = PathInterpreterLocator("sh").locate();
    CHECK(sh.is_absolute());
    CHECK(sh.filename() == "sh");

    CHECK(PathInterpreterLocator("/bin/sh").locate() == "/bin/sh");
    CHECK_THROWS_AS(PathInterpreterLocator("ea-gherkin-no-such-shell").locate(), LaunchError);
    CHECK_THROWS_AS(PathInterpreterLocator("/nonexistent/bin/sh").locate(), LaunchError);

    Session session(PathInterpreterLocator("sh"), 0);
    CHECK(session.config().interpreter == sh);
}
