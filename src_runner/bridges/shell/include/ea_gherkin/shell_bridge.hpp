#pragma once

#include "ea_gherkin/step_executor.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace ea::gherkin { class InterpreterLocator; }

namespace ea::gherkin::shell_bridge
{

/**
 * Runs step scripts in a child process: `<interpreter> -c <script>`.
 *
 * Each call forks a fresh child whose environment is built from scratch: a copy of the
 * runner's environment without any inherited MATCH_* / PREVIOUS_STEP_STDOUT entries,
 * plus MATCH_1..MATCH_N and PREVIOUS_STEP_STDOUT for this step. Sibling invocations
 * therefore never observe each other's variables.
 *
 * stdin is /dev/null; stdout and stderr are captured through pipes and returned once the
 * child has exited. There is no timeout unless Config::timeout_sec is set.
 */
class Session final : public StepExecutor
{
public:
    struct Config
    {
        // Interpreter executable (absolute path, see InterpreterLocator).
        std::filesystem::path interpreter;

        // Per-step timeout in seconds (0 = wait until the child exits).
        int timeout_sec{0};

        // Start from the runner's environment; when false the child sees only the step variables.
        bool inherit_environment{true};
    };

    explicit Session(Config cfg);

    /**
     * Locates the interpreter up front so that a missing shell is reported before any step
     * runs. Throws LaunchError.
     */
    Session(const InterpreterLocator& locator, int timeout_sec);

    [[nodiscard]] const Config& config() const noexcept { return cfg_; }

    /**
     * Runs one step and blocks until the child exits (or the timeout kills it).
     *
     * Exit status: the child's exit code, 128+N when killed by signal N, 124 on timeout.
     * An empty script is not spawned and yields exit code 1 with "Empty script content".
     * Throws LaunchError when the interpreter cannot be started.
     */
    StepInvocationResult execute(const StepInvocation& invocation) override;

    /// `NAME=value` entries handed to execve() for this invocation.
    [[nodiscard]] static std::vector<std::string> build_environment(const StepInvocation& invocation,
                                                                    bool inherit_environment);

private:
    Config cfg_;
};

} // namespace ea::gherkin::shell_bridge
