#pragma once

#include "source_provider.hpp"

#include <cstddef>
#include <regex>
#include <string>
#include <vector>

namespace ea::gherkin {

/**
 * \brief One `IMPLEMENTS` block as written in an implementation document.
 */
struct Declaration {
    std::string pattern;
    std::string script;   ///< Cleaned script body
    std::size_t line{0};  ///< Line of the IMPLEMENTS keyword
};

/**
 * \brief Splits an implementation document into declarations.
 *
 * \code{.txt}
 * IMPLEMENTS count should be (\d+)
 * #!/bin/bash
 * test "$PREVIOUS_STEP_STDOUT" = "$MATCH_1"
 *
 * IMPLEMENTS I increment the counter
 * echo $((PREVIOUS_STEP_STDOUT + 1))
 * \endcode
 *
 * A script body runs until the next IMPLEMENTS line or the end of the document. The body
 * is cleaned before it is stored: line endings normalised, a leading shebang dropped,
 * trailing whitespace removed from every line and trailing blank lines removed. Text above
 * the first declaration is ignored. An IMPLEMENTS line without a pattern raises ParseError.
 */
[[nodiscard]] std::vector<Declaration> parse_implementation_document(const SourceDocument& document);

/// Same clean-up that parse_implementation_document() applies to each body.
[[nodiscard]] std::string clean_script(const std::string& script);

/**
 * \brief A compiled pattern bound to the script that implements it.
 */
struct ImplementationEntry {
    std::string pattern;
    std::regex compiled;
    std::string script;
    std::string source;   ///< Provenance (document id)
    std::size_t line{0};
    std::size_t index{0}; ///< Position in the catalog
};

/**
 * \brief Ordered, read-only table of every step implementation available to a run.
 *
 * Order is document order, then declaration order inside a document. Patterns are
 * compiled case-insensitively with the ECMAScript grammar; the first invalid pattern
 * raises CatalogError before any step is executed.
 */
class ImplementationCatalog {
public:
    [[nodiscard]] static ImplementationCatalog compile(const std::vector<SourceDocument>& documents);

    [[nodiscard]] static ImplementationCatalog compile(const SourceProvider& provider);

    [[nodiscard]] const std::vector<ImplementationEntry>& entries() const noexcept { return entries_; }
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

private:
    ImplementationCatalog() = default;

    std::vector<ImplementationEntry> entries_;
};

}  // namespace ea::gherkin
