#include "ea_gherkin/engine.hpp"
#include "ea_gherkin/logging.hpp"
#include "ea_gherkin/text.hpp"

#include <string>
#include <utility>
#include <vector>

namespace {

using ea::gherkin::RunSummary;
using ea::gherkin::ScenarioOutcome;
using ea::gherkin::StepStatus;

std::string step_label(const ea::gherkin::Step& step) {
    return step.keyword + " " + step.text;
}

void count_scenario(RunSummary& summary, const ScenarioOutcome& outcome) {
    ++summary.scenarios.total;
    if (outcome.status == StepStatus::Passed) {
        ++summary.scenarios.passed;
    } else {
        ++summary.scenarios.failed;
        if (outcome.status == StepStatus::Undefined) {
            ++summary.scenarios.undefined;
        }
    }

    for (const auto& step : outcome.steps) {
        ++summary.steps.total;
        switch (step.status) {
            case StepStatus::Passed: ++summary.steps.passed; break;
            case StepStatus::Failed: ++summary.steps.failed; break;
            case StepStatus::Skipped: ++summary.steps.skipped; break;
            case StepStatus::Undefined: ++summary.steps.undefined; break;
            case StepStatus::NotRun: break;
        }
    }
}

}  // namespace

namespace ea::gherkin {

std::string_view to_string(StepStatus status) noexcept {
    switch (status) {
        case StepStatus::NotRun: return "not-run";
        case StepStatus::Passed: return "passed";
        case StepStatus::Failed: return "failed";
        case StepStatus::Skipped: return "skipped";
        case StepStatus::Undefined: return "undefined";
    }
    return "not-run";
}

StepStatus derive_status(const std::vector<StepOutcome>& steps) noexcept {
    for (const auto& step : steps) {
        if (step.status == StepStatus::Failed) {
            return StepStatus::Failed;
        }
    }
    for (const auto& step : steps) {
        if (step.status != StepStatus::Passed && step.status != StepStatus::Skipped) {
            return step.status;
        }
    }
    for (const auto& step : steps) {
        if (step.status != StepStatus::Passed) {
            return step.status;
        }
    }
    return StepStatus::Passed;
}

int exit_code(const RunResult& result) noexcept {
    for (const auto& scenario : result.scenarios) {
        if (scenario.status != StepStatus::Passed) {
            return 1;
        }
    }
    return 0;
}

Engine::Engine(const StepResolver& resolver, StepExecutor& executor)
    : Engine(resolver, executor, Config{}) {}

Engine::Engine(const StepResolver& resolver, StepExecutor& executor, Config config)
    : resolver_(resolver), executor_(executor), config_(config) {}

RunResult Engine::run(const Feature& feature) const {
    RunResult result;
    result.feature_name = feature.name;
    result.source = feature.source;
    result.narrative = feature.narrative;
    result.tags = feature.tags;
    result.scenarios.reserve(feature.scenarios.size());

    if (config_.listener != nullptr) {
        config_.listener->feature_started(feature);
    }

    for (const auto& scenario : feature.scenarios) {
        auto outcome = run_scenario(scenario);
        count_scenario(result.summary, outcome);
        if (config_.listener != nullptr) {
            config_.listener->scenario_finished(outcome);
        }
        result.scenarios.push_back(std::move(outcome));
    }

    if (config_.listener != nullptr) {
        config_.listener->run_finished(result);
    }
    return result;
}

ScenarioOutcome Engine::run_scenario(const Scenario& scenario) const {
    if (config_.listener != nullptr) {
        config_.listener->scenario_started(scenario);
    }

    logging::get()->debug("Scenario: {} ({} steps)", scenario.name, scenario.steps.size());

    ScenarioOutcome outcome;
    outcome.name = scenario.name;
    outcome.tags = scenario.tags;
    outcome.line = scenario.line;
    outcome.steps.reserve(scenario.steps.size());

    bool skipping = false;
    std::string previous_output;

    for (const auto& step : scenario.steps) {
        StepOutcome step_outcome;
        if (skipping) {
            step_outcome.step = step;
            step_outcome.status = StepStatus::Skipped;
        } else {
            step_outcome = run_step(step, previous_output);
            if (step_outcome.status == StepStatus::Passed) {
                previous_output = text::strip_trailing_newlines(step_outcome.output->stdout_text);
            } else {
                skipping = true;
            }
        }
        if (config_.listener != nullptr) {
            config_.listener->step_finished(step_outcome);
        }
        outcome.steps.push_back(std::move(step_outcome));
    }

    outcome.status = derive_status(outcome.steps);
    return outcome;
}

StepOutcome Engine::run_step(const Step& step, const std::string& previous_output) const {
    StepOutcome outcome;
    outcome.step = step;

    auto resolution = resolver_.resolve(step);
    if (!resolution) {
        outcome.status = StepStatus::Undefined;
        outcome.message = "No implementation found for: " + step_label(step);
        logging::get()->debug("{}", outcome.message);
        return outcome;
    }

    const auto& entry = *resolution->entry;
    outcome.implementation = entry.source + ":" + std::to_string(entry.line);

    StepInvocation invocation;
    invocation.script = entry.script;
    invocation.captures = std::move(resolution->captures);
    invocation.previous_output = previous_output;
    invocation.label = step_label(step);

    auto invoked = executor_.execute(invocation);

    outcome.status = invoked.succeeded() ? StepStatus::Passed : StepStatus::Failed;
    if (outcome.status == StepStatus::Failed) {
        outcome.message = invoked.capture_failed ? "output capture failed"
                                                 : "exit code " + std::to_string(invoked.exit_code);
    }
    outcome.output = StepOutput{invoked.exit_code, std::move(invoked.stdout_text),
                                std::move(invoked.stderr_text)};
    return outcome;
}

}  // namespace ea::gherkin
