#pragma once

#include "engine.hpp"

#include <filesystem>
#include <ostream>
#include <string>

namespace ea::gherkin {

/**
 * \brief Renders a RunResult for people and for machines.
 *
 * - render_text(): scenario/step listing with status glyphs, diagnostics of failed and
 *   undefined steps inline, and a summary block.
 * - render_json(): the same information as a JSON document (feature, summary, scenarios).
 * - render_html(): a detailed HTML page with one table per scenario.
 *
 * Every fact printed by render_text() can be read back from render_json().
 * None of the renderings carry timestamps, so identical runs render identically.
 */
class ReportWriter {
public:
    ReportWriter() = default;

    [[nodiscard]] std::string render_text(const RunResult& result, bool color = false) const;

    [[nodiscard]] std::string render_json(const RunResult& result) const;

    [[nodiscard]] std::string render_html(const RunResult& result) const;

    void write_summary(const std::filesystem::path& destination, const RunResult& result) const;

    void write_detailed(const std::filesystem::path& destination, const RunResult& result) const;
};

/**
 * \brief Streams the text report while the run is in progress.
 *
 * The concatenated output equals ReportWriter::render_text() for the same result.
 */
class TextReportListener final : public RunListener {
public:
    explicit TextReportListener(std::ostream& out, bool color = false);

    void feature_started(const Feature& feature) override;
    void scenario_started(const Scenario& scenario) override;
    void step_finished(const StepOutcome& outcome) override;
    void run_finished(const RunResult& result) override;

private:
    std::ostream& out_;
    bool color_;
};

}  // namespace ea::gherkin
