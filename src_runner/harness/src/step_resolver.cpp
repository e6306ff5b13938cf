#include "ea_gherkin/step_resolver.hpp"
#include "ea_gherkin/logging.hpp"

#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace {

using ea::gherkin::ImplementationEntry;
using ea::gherkin::Resolution;

std::optional<Resolution> try_entry(const ImplementationEntry& entry,
                                    const std::string& text,
                                    const std::string& full_text) {
    std::smatch match;
    if (!std::regex_match(text, match, entry.compiled) &&
        !std::regex_match(full_text, match, entry.compiled)) {
        return std::nullopt;
    }

    Resolution resolution;
    resolution.entry = &entry;
    for (std::size_t i = 1; i < match.size(); ++i) {
        resolution.captures.push_back(match[i].matched ? match[i].str() : std::string{});
    }
    return resolution;
}

std::string full_step_text(const std::string& keyword, const std::string& text) {
    if (keyword.empty()) {
        return text;
    }
    return keyword + " " + text;
}

}  // namespace

namespace ea::gherkin {

StepResolver::StepResolver(const ImplementationCatalog& catalog)
    : StepResolver(catalog, Options{}) {}

StepResolver::StepResolver(const ImplementationCatalog& catalog, Options options)
    : catalog_(catalog), options_(options) {}

std::optional<Resolution> StepResolver::resolve(const Step& step) const {
    return resolve(step.keyword, step.text);
}

std::optional<Resolution> StepResolver::resolve(const std::string& keyword,
                                                const std::string& text) const {
    auto log = logging::get();
    const auto full_text = full_step_text(keyword, text);

    const auto& entries = catalog_.entries();
    for (std::size_t i = 0; i < entries.size(); ++i) {
        auto resolution = try_entry(entries[i], text, full_text);
        if (!resolution) {
            continue;
        }
        log->debug("Step '{}' matched '{}' ({}:{})", full_text, entries[i].pattern,
                   entries[i].source, entries[i].line);

        if (options_.warn_ambiguous) {
            for (std::size_t j = i + 1; j < entries.size(); ++j) {
                if (try_entry(entries[j], text, full_text)) {
                    log->warn("Step '{}' also matches '{}' ({}:{}); using '{}' ({}:{})",
                              full_text, entries[j].pattern, entries[j].source, entries[j].line,
                              entries[i].pattern, entries[i].source, entries[i].line);
                }
            }
        }
        return resolution;
    }

    log->debug("No implementation found for: {}", full_text);
    return std::nullopt;
}

std::vector<Resolution> StepResolver::matches(const std::string& keyword,
                                              const std::string& text) const {
    const auto full_text = full_step_text(keyword, text);
    std::vector<Resolution> found;
    for (const auto& entry : catalog_.entries()) {
        if (auto resolution = try_entry(entry, text, full_text)) {
            found.push_back(std::move(*resolution));
        }
    }
    return found;
}

}  // namespace ea::gherkin
