#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace ea::gherkin {

/**
 * \brief Semantic type of a step, independent of the keyword it was written with.
 *
 * `And`, `But` and `*` carry no type of their own; the parser resolves them to the type
 * of the previous step in the same block.
 */
enum class StepType {
    Context,  ///< Given
    Action,   ///< When
    Outcome,  ///< Then
};

[[nodiscard]] std::string_view to_string(StepType type) noexcept;

/**
 * \brief One step line after parsing.
 */
struct Step {
    std::string keyword;  ///< Keyword as written (Given/When/Then/And/But/*)
    StepType type{StepType::Context};
    bool continuation{false};
    std::string text;     ///< Text after the keyword, trimmed
    std::size_t line{0};
    bool from_background{false};
};

/**
 * \brief One scenario. Background steps are already prepended to `steps`.
 */
struct Scenario {
    std::string name;
    std::string keyword{"Scenario"};
    std::vector<std::string> tags;
    std::size_t line{0};
    std::vector<Step> steps;
};

/**
 * \brief Parsed feature document. Treated as immutable once the parser returns it.
 */
struct Feature {
    std::string name;
    std::string source;     ///< Document identifier (usually the file path)
    std::string narrative;  ///< Free text below the title, kept for reporting only
    std::vector<std::string> tags;
    std::vector<Scenario> scenarios;
};

}  // namespace ea::gherkin
