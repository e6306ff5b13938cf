#include "ea_gherkin/implementation_catalog.hpp"
#include "ea_gherkin/errors.hpp"
#include "ea_gherkin/logging.hpp"
#include "ea_gherkin/text.hpp"

#include <map>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

constexpr std::string_view kDeclarationKeyword = "IMPLEMENTS";

/// Pattern text when `line` (already trimmed) is a declaration line.
std::optional<std::string> declaration_pattern(std::string_view line) {
    if (line.substr(0, kDeclarationKeyword.size()) != kDeclarationKeyword) {
        return std::nullopt;
    }
    const auto rest = line.substr(kDeclarationKeyword.size());
    if (!rest.empty() && rest.find_first_of(ea::gherkin::text::kWhitespace) != 0) {
        return std::nullopt;  // e.g. IMPLEMENTSfoo
    }
    return ea::gherkin::text::trim_copy(rest);
}

}  // namespace

namespace ea::gherkin {

std::string clean_script(const std::string& script) {
    auto lines = text::split_lines(text::normalize_line_endings(script));

    if (!lines.empty() && text::trim_copy(lines.front()).rfind("#!", 0) == 0) {
        lines.erase(lines.begin());
    }
    for (auto& line : lines) {
        line = text::rtrim_copy(line);
    }
    while (!lines.empty() && lines.back().empty()) {
        lines.pop_back();
    }

    std::string cleaned;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i != 0) {
            cleaned.push_back('\n');
        }
        cleaned += lines[i];
    }
    return cleaned;
}

std::vector<Declaration> parse_implementation_document(const SourceDocument& document) {
    const auto lines = text::split_lines(text::normalize_line_endings(document.text));

    std::vector<Declaration> declarations;
    std::optional<Declaration> current;
    std::string body;

    auto flush = [&]() {
        if (!current) {
            return;
        }
        current->script = clean_script(body);
        declarations.push_back(std::move(*current));
        current.reset();
        body.clear();
    };

    for (std::size_t index = 0; index < lines.size(); ++index) {
        const auto& line = lines[index];
        if (auto pattern = declaration_pattern(text::trim_copy(line))) {
            if (pattern->empty()) {
                throw ParseError(document.id, index + 1, "'IMPLEMENTS' without a step pattern");
            }
            flush();
            current = Declaration{std::move(*pattern), {}, index + 1};
            continue;
        }
        if (current) {
            body += line;
            body.push_back('\n');
        }
    }
    flush();
    return declarations;
}

ImplementationCatalog ImplementationCatalog::compile(const std::vector<SourceDocument>& documents) {
    auto log = logging::get();

    ImplementationCatalog catalog;
    std::map<std::string, const ImplementationEntry*> seen;

    log->info("Loading implementations from {} file(s)...", documents.size());

    for (const auto& document : documents) {
        auto declarations = parse_implementation_document(document);
        log->debug("Loading implementations from: {} ({} found)", document.id, declarations.size());

        for (auto& declaration : declarations) {
            ImplementationEntry entry;
            try {
                entry.compiled = std::regex(declaration.pattern,
                                            std::regex::ECMAScript | std::regex::icase);
            } catch (const std::regex_error& ex) {
                throw CatalogError(document.id, declaration.line, declaration.pattern, ex.what());
            }
            entry.pattern = std::move(declaration.pattern);
            entry.script = std::move(declaration.script);
            entry.source = document.id;
            entry.line = declaration.line;
            entry.index = catalog.entries_.size();
            log->debug("  - {}", entry.pattern);
            catalog.entries_.push_back(std::move(entry));
        }
    }

    // Pointers into entries_ are only taken once the vector is final.
    for (const auto& entry : catalog.entries_) {
        auto [it, inserted] = seen.emplace(entry.pattern, &entry);
        if (!inserted) {
            log->warn("Duplicate implementation for step '{}' at {}:{} (first declared at {}:{}, "
                      "which takes precedence)",
                      entry.pattern, entry.source, entry.line, it->second->source,
                      it->second->line);
        }
    }

    if (catalog.entries_.empty()) {
        throw CatalogError("No step implementations found");
    }

    log->info("Found {} step implementations.", catalog.entries_.size());
    return catalog;
}

ImplementationCatalog ImplementationCatalog::compile(const SourceProvider& provider) {
    return compile(provider.documents());
}

}  // namespace ea::gherkin
