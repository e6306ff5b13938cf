#pragma once

#include <string>
#include <vector>

namespace ea::gherkin {

/// Environment variable carrying capture group N is kCaptureVariablePrefix + N (1-based).
inline constexpr const char* kCaptureVariablePrefix = "MATCH_";

/// Environment variable carrying the previous step's standard output.
inline constexpr const char* kPreviousOutputVariable = "PREVIOUS_STEP_STDOUT";

/**
 * \brief Everything a child process needs to run one step.
 */
struct StepInvocation {
    std::string script;
    std::vector<std::string> captures;  ///< Exported as MATCH_1..MATCH_N
    std::string previous_output;        ///< Exported as PREVIOUS_STEP_STDOUT
    std::string label;                  ///< Human readable step text, for diagnostics
};

/**
 * \brief Fully buffered outcome of one invocation.
 */
struct StepInvocationResult {
    int exit_code{0};
    std::string stdout_text;
    std::string stderr_text;
    bool capture_failed{false};  ///< Output could not be read completely

    [[nodiscard]] bool succeeded() const noexcept { return exit_code == 0 && !capture_failed; }
};

/**
 * \brief Runs step scripts. The process-spawning implementation is
 * shell_bridge::Session; tests substitute their own.
 *
 * Implementations block until the step has finished. Failing to launch the interpreter
 * at all is reported by throwing LaunchError, never through the result.
 */
class StepExecutor {
public:
    virtual ~StepExecutor() = default;

    virtual StepInvocationResult execute(const StepInvocation& invocation) = 0;
};

}  // namespace ea::gherkin
