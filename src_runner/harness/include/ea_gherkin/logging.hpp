#pragma once

#include <memory>
#include <optional>
#include <string_view>

#include <spdlog/spdlog.h>

namespace ea::gherkin::logging {

inline constexpr const char* kLoggerName = "ea-gherkin";

/**
 * \brief Creates (or reconfigures) the runner logger, writing to stderr.
 *
 * Reports are written to stdout by the CLI, so log lines never interleave with a JSON
 * document printed there.
 */
void init(spdlog::level::level_enum level);

/// Runner logger. Created on first use at `warn` level when init() was never called.
[[nodiscard]] std::shared_ptr<spdlog::logger> get();

/// Parses `trace|debug|info|warn|error|off` (case-insensitive).
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_level(std::string_view name);

/// Level named by EA_GHERKIN_LOG_LEVEL, if set to a recognised value.
[[nodiscard]] std::optional<spdlog::level::level_enum> level_from_environment();

}  // namespace ea::gherkin::logging
