#include "ea_gherkin/feature_parser.hpp"
#include "ea_gherkin/errors.hpp"
#include "ea_gherkin/text.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

using ea::gherkin::ParseError;
using ea::gherkin::Scenario;
using ea::gherkin::Step;
using ea::gherkin::StepType;

struct StepKeyword {
    std::string_view word;
    std::optional<StepType> type;  ///< nullopt for continuations
};

constexpr std::array<StepKeyword, 6> kStepKeywords{{
    {"Given", StepType::Context},
    {"When", StepType::Action},
    {"Then", StepType::Outcome},
    {"And", std::nullopt},
    {"But", std::nullopt},
    {"*", std::nullopt},
}};

constexpr std::array<std::string_view, 5> kUnsupportedHeaders{
    "Scenario Outline:", "Scenario Template:", "Examples:", "Scenarios:", "Rule:"};

bool starts_with(std::string_view line, std::string_view prefix) {
    return line.substr(0, prefix.size()) == prefix;
}

/// Returns the trimmed text after `header` when `line` opens with it.
std::optional<std::string> header_value(std::string_view line, std::string_view header) {
    if (!starts_with(line, header)) {
        return std::nullopt;
    }
    return ea::gherkin::text::trim_copy(line.substr(header.size()));
}

struct StepLine {
    const StepKeyword* keyword;
    std::string text;
};

std::optional<StepLine> match_step(std::string_view line) {
    for (const auto& keyword : kStepKeywords) {
        if (!starts_with(line, keyword.word)) {
            continue;
        }
        const auto rest = line.substr(keyword.word.size());
        if (!rest.empty() && rest.front() != ' ' && rest.front() != '\t') {
            continue;
        }
        return StepLine{&keyword, ea::gherkin::text::trim_copy(rest)};
    }
    return std::nullopt;
}

/// Tags on `line`, or nullopt when the line is prose that merely starts with '@'.
std::optional<std::vector<std::string>> parse_tags(std::string_view line) {
    std::vector<std::string> tags;
    std::istringstream stream{std::string{line}};
    std::string token;
    while (stream >> token) {
        if (token.front() == '#') {
            break;  // trailing comment
        }
        if (token.size() < 2 || token.front() != '@') {
            return std::nullopt;
        }
        tags.push_back(std::move(token));
    }
    return tags;
}

enum class Block { None, Feature, Background, Scenario };

}  // namespace

namespace ea::gherkin {

std::string_view to_string(StepType type) noexcept {
    switch (type) {
        case StepType::Context: return "context";
        case StepType::Action: return "action";
        case StepType::Outcome: return "outcome";
    }
    return "context";
}

Feature FeatureParser::parse(std::string_view input, const std::string& source) const {
    const auto lines = text::split_lines(text::normalize_line_endings(input));

    Feature feature;
    feature.source = source;

    bool have_feature = false;
    bool have_background = false;
    std::vector<Step> background;
    std::vector<std::string> narrative;
    std::vector<std::string> pending_tags;
    std::size_t pending_tags_line = 0;

    Block block = Block::None;
    std::optional<StepType> last_type;
    std::size_t block_steps = 0;

    auto finish_scenario = [&]() {
        if (block != Block::Scenario) {
            return;
        }
        const auto& scenario = feature.scenarios.back();
        if (block_steps == 0) {
            throw ParseError(source, scenario.line,
                             "scenario '" + scenario.name + "' has no steps");
        }
    };

    auto open_block = [&](Block next) {
        finish_scenario();
        block = next;
        block_steps = 0;
        last_type.reset();
    };

    auto take_tags = [&]() {
        auto tags = std::move(pending_tags);
        pending_tags.clear();
        return tags;
    };

    auto reject_pending_tags = [&](std::size_t line_no) {
        if (!pending_tags.empty()) {
            throw ParseError(source, line_no,
                             "tags must be followed by 'Feature:' or 'Scenario:'");
        }
    };

    for (std::size_t index = 0; index < lines.size(); ++index) {
        const std::size_t line_no = index + 1;
        const auto trimmed = text::trim_copy(lines[index]);

        if (trimmed.empty() || trimmed.front() == '#') {
            continue;
        }

        if (trimmed.front() == '@') {
            if (auto tags = parse_tags(trimmed)) {
                if (pending_tags.empty()) {
                    pending_tags_line = line_no;
                }
                pending_tags.insert(pending_tags.end(), tags->begin(), tags->end());
                continue;
            }
        }

        if (auto name = header_value(trimmed, "Feature:")) {
            if (have_feature) {
                throw ParseError(source, line_no, "duplicate 'Feature:' line");
            }
            have_feature = true;
            feature.name = std::move(*name);
            feature.tags = take_tags();
            block = Block::Feature;
            continue;
        }

        if (!have_feature) {
            throw ParseError(source, line_no, "expected 'Feature:' but found '" + trimmed + "'");
        }

        for (const auto header : kUnsupportedHeaders) {
            if (starts_with(trimmed, header)) {
                throw ParseError(source, line_no,
                                 "'" + std::string{header} + "' is not supported");
            }
        }

        if (header_value(trimmed, "Background:")) {
            if (have_background) {
                throw ParseError(source, line_no, "only one 'Background:' block is allowed");
            }
            if (!feature.scenarios.empty()) {
                throw ParseError(source, line_no,
                                 "'Background:' must come before the first scenario");
            }
            reject_pending_tags(line_no);
            have_background = true;
            open_block(Block::Background);
            continue;
        }

        std::optional<std::string> scenario_name = header_value(trimmed, "Scenario:");
        std::string scenario_keyword = "Scenario";
        if (!scenario_name) {
            scenario_name = header_value(trimmed, "Example:");
            scenario_keyword = "Example";
        }
        if (scenario_name) {
            open_block(Block::Scenario);
            Scenario scenario;
            scenario.name = std::move(*scenario_name);
            scenario.keyword = std::move(scenario_keyword);
            scenario.tags = take_tags();
            scenario.line = line_no;
            scenario.steps = background;
            feature.scenarios.push_back(std::move(scenario));
            continue;
        }

        if (starts_with(trimmed, "\"\"\"") || starts_with(trimmed, "```")) {
            throw ParseError(source, line_no, "doc string step arguments are not supported");
        }
        if (trimmed.front() == '|') {
            throw ParseError(source, line_no, "data table step arguments are not supported");
        }

        reject_pending_tags(pending_tags_line);

        if (auto step_line = match_step(trimmed)) {
            if (block == Block::Feature) {
                throw ParseError(source, line_no,
                                 "step outside of a 'Scenario:' or 'Background:' block");
            }
            const auto& keyword = *step_line->keyword;
            if (step_line->text.empty()) {
                throw ParseError(source, line_no,
                                 "step '" + std::string{keyword.word} + "' has no text");
            }
            if (!keyword.type && !last_type) {
                throw ParseError(source, line_no,
                                 "'" + std::string{keyword.word} +
                                     "' has no previous step to continue in this block");
            }

            Step step;
            step.keyword = std::string{keyword.word};
            step.continuation = !keyword.type.has_value();
            step.type = keyword.type ? *keyword.type : *last_type;
            step.text = std::move(step_line->text);
            step.line = line_no;
            step.from_background = block == Block::Background;
            last_type = step.type;
            ++block_steps;

            if (block == Block::Background) {
                background.push_back(std::move(step));
            } else {
                feature.scenarios.back().steps.push_back(std::move(step));
            }
            continue;
        }

        if (block == Block::Feature) {
            narrative.push_back(trimmed);
            continue;
        }
        if (block_steps == 0) {
            continue;  // block description
        }
        throw ParseError(source, line_no, "unexpected line '" + trimmed + "'");
    }

    if (!have_feature) {
        throw ParseError(source, 0, "no 'Feature:' found");
    }
    reject_pending_tags(pending_tags_line);
    finish_scenario();
    if (feature.scenarios.empty()) {
        throw ParseError(source, lines.size(), "feature '" + feature.name + "' has no scenarios");
    }

    std::string joined;
    for (const auto& line : narrative) {
        if (!joined.empty()) {
            joined.push_back('\n');
        }
        joined += line;
    }
    feature.narrative = std::move(joined);
    return feature;
}

Feature FeatureParser::load(const std::filesystem::path& file) const {
    return parse(text::read_document(file), file.string());
}

}  // namespace ea::gherkin
