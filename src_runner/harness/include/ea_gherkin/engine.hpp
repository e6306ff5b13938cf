#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "feature.hpp"
#include "step_executor.hpp"
#include "step_resolver.hpp"

namespace ea::gherkin {

enum class StepStatus { NotRun, Passed, Failed, Skipped, Undefined };

/// Lower-case status name used in both reports (`not-run`, `passed`, ...).
[[nodiscard]] std::string_view to_string(StepStatus status) noexcept;

/**
 * \brief Captured output of a step that was actually executed.
 */
struct StepOutput {
    int exit_code{0};
    std::string stdout_text;
    std::string stderr_text;
};

struct StepOutcome {
    Step step;
    StepStatus status{StepStatus::NotRun};
    std::optional<StepOutput> output;  ///< Set only when a child process ran
    std::string message;               ///< Undefined/failure diagnostics
    std::string implementation;        ///< `<source>:<line>` of the matched entry, if any
};

struct ScenarioOutcome {
    std::string name;
    std::vector<std::string> tags;
    std::size_t line{0};
    StepStatus status{StepStatus::NotRun};  ///< Derived, see derive_status()
    std::vector<StepOutcome> steps;
};

struct RunSummary {
    struct Scenarios {
        std::size_t total{0};
        std::size_t passed{0};
        std::size_t failed{0};     ///< Every scenario that did not pass
        std::size_t undefined{0};  ///< Subset of `failed` whose status is undefined
    } scenarios;

    struct Steps {
        std::size_t total{0};
        std::size_t passed{0};
        std::size_t failed{0};
        std::size_t skipped{0};
        std::size_t undefined{0};
    } steps;
};

/**
 * \brief Everything the reporters need: feature identity, per-step outcomes and counts.
 */
struct RunResult {
    std::string feature_name;
    std::string source;
    std::string narrative;
    std::vector<std::string> tags;
    std::vector<ScenarioOutcome> scenarios;
    RunSummary summary;
};

/**
 * \brief Scenario status from its step outcomes: failed if any step failed, passed if all
 * passed, otherwise the status of the first step that is neither passed nor skipped.
 */
[[nodiscard]] StepStatus derive_status(const std::vector<StepOutcome>& steps) noexcept;

/// 0 when every scenario passed, 1 otherwise.
[[nodiscard]] int exit_code(const RunResult& result) noexcept;

/**
 * \brief Progress notifications, delivered in execution order.
 */
class RunListener {
public:
    virtual ~RunListener() = default;

    virtual void feature_started(const Feature& /*feature*/) {}
    virtual void scenario_started(const Scenario& /*scenario*/) {}
    virtual void step_finished(const StepOutcome& /*outcome*/) {}
    virtual void scenario_finished(const ScenarioOutcome& /*outcome*/) {}
    virtual void run_finished(const RunResult& /*result*/) {}
};

/**
 * \brief Walks a feature scenario by scenario and step by step.
 *
 * Steps run strictly one after another. Once a step fails or is undefined, the remaining
 * steps of its scenario are skipped without being executed. Each scenario starts with an
 * empty PREVIOUS_STEP_STDOUT; after a passed step it holds that step's stdout minus
 * trailing newlines.
 *
 * LaunchError thrown by the executor aborts the run and propagates to the caller.
 */
class Engine {
public:
    struct Config {
        RunListener* listener{nullptr};
    };

    Engine(const StepResolver& resolver, StepExecutor& executor);
    Engine(const StepResolver& resolver, StepExecutor& executor, Config config);

    [[nodiscard]] RunResult run(const Feature& feature) const;

private:
    [[nodiscard]] ScenarioOutcome run_scenario(const Scenario& scenario) const;
    [[nodiscard]] StepOutcome run_step(const Step& step, const std::string& previous_output) const;

    const StepResolver& resolver_;
    StepExecutor& executor_;
    Config config_;
};

}  // namespace ea::gherkin
