#pragma once

#include "feature.hpp"
#include "implementation_catalog.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ea::gherkin {

/**
 * \brief Implementation chosen for one step, with the texts of its capture groups.
 */
struct Resolution {
    const ImplementationEntry* entry{nullptr};
    std::vector<std::string> captures;  ///< Group 1..N; non-participating groups are empty
};

/**
 * \brief Maps step text to a catalog entry.
 *
 * A pattern matches when it matches the whole step text, or failing that the whole of
 * `"<keyword> <text>"`. When several entries match, the first one in catalog order wins,
 * regardless of how specific the others are. No match is not an error: the step is
 * reported as undefined.
 *
 * The resolver only references the catalog; the catalog must outlive it.
 */
class StepResolver {
public:
    struct Options {
        /// Log a warning listing the other entries when a step matches more than one.
        bool warn_ambiguous{false};
    };

    explicit StepResolver(const ImplementationCatalog& catalog);
    StepResolver(const ImplementationCatalog& catalog, Options options);
    explicit StepResolver(ImplementationCatalog&&) = delete;
    StepResolver(ImplementationCatalog&&, Options) = delete;

    [[nodiscard]] std::optional<Resolution> resolve(const Step& step) const;

    [[nodiscard]] std::optional<Resolution> resolve(const std::string& keyword,
                                                    const std::string& text) const;

    /// Every entry matching the step, in catalog order.
    [[nodiscard]] std::vector<Resolution> matches(const std::string& keyword,
                                                  const std::string& text) const;

private:
    const ImplementationCatalog& catalog_;
    Options options_;
};

}  // namespace ea::gherkin
