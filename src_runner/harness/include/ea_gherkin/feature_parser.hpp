#pragma once

#include "feature.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace ea::gherkin {

/**
 * \brief Turns the text of one feature document into a Feature tree.
 *
 * The accepted subset of Gherkin is line oriented:
 *
 * \code{.txt}
 * @smoke
 * Feature: Counter
 *   Free narrative text, kept for the report.
 *
 *   Background:
 *     Given a fresh counter
 *
 *   Scenario: Increment
 *     When I increment the counter
 *     Then count should be 1
 *     And the counter is not negative
 * \endcode
 *
 * Lines starting with `#` and blank lines are skipped. `And`, `But` and `*` inherit the
 * semantic type of the previous step in the same Background or Scenario block; using one
 * as the first step of a block is an error. Scenario outlines, rules, doc strings and data
 * tables are rejected.
 *
 * Any violation raises ParseError with the document identifier and the 1-based line.
 * The parser does no pattern matching of step text.
 */
class FeatureParser {
public:
    FeatureParser() = default;

    [[nodiscard]] Feature parse(std::string_view text, const std::string& source) const;

    [[nodiscard]] Feature load(const std::filesystem::path& file) const;
};

}  // namespace ea::gherkin
