/**
 * @file test_feature_parser.cpp
 * @brief Tests for the feature document parser
 *
 * Scope:
 *  - Title, narrative, tags, Background prepending and scenario/step structure
 *  - Keyword inheritance for And/But/'*' (per block, unaffected by comments and blank lines)
 *  - ParseError reporting (document identifier and line) for malformed documents
 *
 * Strategy:
 *  - Parse small in-memory documents and inspect the resulting tree.
 */

#include <catch2/catch_test_macros.hpp>

#include "ea_gherkin/errors.hpp"
#include "ea_gherkin/feature_parser.hpp"

#include <string>

using ea::gherkin::Feature;
using ea::gherkin::FeatureParser;
using ea::gherkin::ParseError;
using ea::gherkin::StepType;

namespace {

Feature parse(const std::string& text) {
    return FeatureParser{}.parse(text, "counter.feature");
}

std::size_t error_line(const std::string& text) {
    try {
        (void)parse(text);
    } catch (const ParseError& ex) {
        return ex.line();
    }
    FAIL("expected ParseError");
    return 0;
}

} // namespace

TEST_CASE("Feature tree with narrative, background and inherited keywords", "[gherkin][parser]")
{
    const auto feature = parse(
        "# leading comment\n"
        "@smoke @counter\n"
        "Feature: Counter\n"
        "  As a user\n"
        "  I want a counter\n"
        "\n"
        "  Background:\n"
        "    Given a fresh counter\n"
        "\n"
        "  Scenario: Increment once\n"
        "    When I increment the counter\n"
        "    Then count should be 1\n"
        "    And the counter is not negative\n"
        "\n"
        "  @slow\n"
        "  Example: Nothing happens\n"
        "    Then count should be 0\n"
        "    But nothing else changed\n");

    CHECK(feature.name == "Counter");
    CHECK(feature.source == "counter.feature");
    CHECK(feature.narrative == "As a user\nI want a counter");
    REQUIRE(feature.tags.size() == 2);
    CHECK(feature.tags[0] == "@smoke");
    CHECK(feature.tags[1] == "@counter");

    REQUIRE(feature.scenarios.size() == 2);

    const auto& first = feature.scenarios[0];
    CHECK(first.name == "Increment once");
    CHECK(first.line == 10);
    CHECK(first.tags.empty());
    REQUIRE(first.steps.size() == 4);
    CHECK(first.steps[0].keyword == "Given");
    CHECK(first.steps[0].text == "a fresh counter");
    CHECK(first.steps[0].from_background);
    CHECK(first.steps[0].line == 8);
    CHECK(first.steps[1].type == StepType::Action);
    CHECK_FALSE(first.steps[1].from_background);
    CHECK(first.steps[2].type == StepType::Outcome);
    CHECK(first.steps[3].keyword == "And");
    CHECK(first.steps[3].continuation);
    CHECK(first.steps[3].type == StepType::Outcome);

    const auto& second = feature.scenarios[1];
    CHECK(second.keyword == "Example");
    REQUIRE(second.tags.size() == 1);
    CHECK(second.tags[0] == "@slow");
    REQUIRE(second.steps.size() == 3);
    CHECK(second.steps[0].text == "a fresh counter");
    CHECK(second.steps[2].keyword == "But");
    CHECK(second.steps[2].type == StepType::Outcome);
}

TEST_CASE("Comments and blank lines do not reset keyword inheritance", "[gherkin][parser]")
{
    const auto feature = parse(
        "Feature: F\n"
        "Scenario: S\n"
        "  When something happens\n"
        "\n"
        "  # explanation\n"
        "  * another thing happens\n");

    REQUIRE(feature.scenarios.size() == 1);
    const auto& steps = feature.scenarios[0].steps;
    REQUIRE(steps.size() == 2);
    CHECK(steps[1].keyword == "*");
    CHECK(steps[1].type == StepType::Action);
}

TEST_CASE("Continuation keyword without a previous step in its block is rejected", "[gherkin][parser]")
{
    SECTION("first step of a scenario") {
        CHECK(error_line("Feature: F\nScenario: S\n  And something\n") == 3);
    }
    SECTION("background steps do not count as previous steps of the scenario block") {
        CHECK(error_line("Feature: F\nBackground:\n  Given a\nScenario: S\n  But b\n") == 5);
    }
    SECTION("first step of the background") {
        CHECK(error_line("Feature: F\nBackground:\n  * a\nScenario: S\n  Given b\n") == 3);
    }
}

TEST_CASE("Structural errors name the offending line", "[gherkin][parser]")
{
    CHECK(error_line("Scenario: S\n  Given a\n") == 1);
    CHECK(error_line("Feature: F\nFeature: G\n") == 2);
    CHECK(error_line("Feature: F\nBackground:\n  Given a\nBackground:\n") == 4);
    CHECK(error_line("Feature: F\nScenario: S\n  Given a\nBackground:\n  Given b\n") == 4);
    CHECK(error_line("Feature: F\nScenario: Empty\nScenario: S\n  Given a\n") == 2);
    CHECK(error_line("Feature: F\n  Given a\n") == 2);
    CHECK(error_line("Feature: F\nScenario: S\n  Given a\n  this is not a step\n") == 4);
    CHECK(error_line("Feature: F\nScenario: S\n  Given\n") == 3);
    CHECK(error_line("Feature: F\nScenario: S\n  Given a\n@orphan\n") == 4);
}

TEST_CASE("Unsupported Gherkin constructs are reported, not ignored", "[gherkin][parser]")
{
    CHECK(error_line("Feature: F\nScenario Outline: O\n  Given <x>\n") == 2);
    CHECK(error_line("Feature: F\nRule: R\n") == 2);
    CHECK(error_line("Feature: F\nScenario: S\n  Given a\n    | x |\n") == 4);
    CHECK(error_line("Feature: F\nScenario: S\n  Given a\n    \"\"\"\n    text\n    \"\"\"\n") == 4);
}

TEST_CASE("Documents without scenarios or without a title are rejected", "[gherkin][parser]")
{
    CHECK_THROWS_AS(parse(""), ParseError);
    CHECK_THROWS_AS(parse("# only a comment\n"), ParseError);
    CHECK_THROWS_AS(parse("Feature: Lonely\n  Just narrative.\n"), ParseError);
}

TEST_CASE("Scenario description lines before the first step are ignored", "[gherkin][parser]")
{
    const auto feature = parse(
        "Feature: F\n"
        "Scenario: S\n"
        "  Some free text describing the scenario.\n"
        "  Given a\n");

    REQUIRE(feature.scenarios.size() == 1);
    REQUIRE(feature.scenarios[0].steps.size() == 1);
    CHECK(feature.scenarios[0].steps[0].text == "a");
}

TEST_CASE("Windows line endings are normalised", "[gherkin][parser]")
{
    const auto feature = parse("Feature: F\r\nScenario: S\r\n  Given a value\r\n  Then it works\r\n");

    REQUIRE(feature.scenarios.size() == 1);
    REQUIRE(feature.scenarios[0].steps.size() == 2);
    CHECK(feature.scenarios[0].steps[0].text == "a value");
    CHECK(feature.scenarios[0].steps[1].text == "it works");
}

TEST_CASE("ParseError message carries document and line", "[gherkin][parser]")
{
    try {
        (void)parse("Feature: F\nScenario: S\n  And x\n");
        FAIL("expected ParseError");
    } catch (const ParseError& ex) {
        CHECK(ex.document() == "counter.feature");
        CHECK(ex.line() == 3);
        CHECK(std::string{ex.what()}.rfind("counter.feature:3: ", 0) == 0);
    }
}

TEST_CASE("Loading a missing feature file raises ParseError", "[gherkin][parser]")
{
    CHECK_THROWS_AS(FeatureParser{}.load("/nonexistent/dir/none.feature"), ParseError);
}

TEST_CASE("Prose starting with '@' is text, not tags", "[gherkin][parser]")
{
    const auto feature = parse(
        "@team\n"
        "Feature: Mentions\n"
        "  @alice asked for this\n"
        "\n"
        "  @smoke\n"
        "  Scenario: S\n"
        "    @bob wrote the description\n"
        "    Given a\n");

    CHECK(feature.narrative == "@alice asked for this");
    REQUIRE(feature.tags.size() == 1);
    CHECK(feature.tags[0] == "@team");
    REQUIRE(feature.scenarios.size() == 1);
    REQUIRE(feature.scenarios[0].tags.size() == 1);
    CHECK(feature.scenarios[0].tags[0] == "@smoke");
    REQUIRE(feature.scenarios[0].steps.size() == 1);

    CHECK(error_line("Feature: F\nScenario: S\n  Given a\n  @carol is not a step\n") == 4);
}
