#include "ea_gherkin/report_writer.hpp"
#include "ea_gherkin/text.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace {

using nlohmann::json;
using ea::gherkin::RunResult;
using ea::gherkin::RunSummary;
using ea::gherkin::ScenarioOutcome;
using ea::gherkin::StepOutcome;
using ea::gherkin::StepStatus;

// ANSI colour codes
constexpr std::string_view kGreen = "\033[92m";
constexpr std::string_view kRed = "\033[91m";
constexpr std::string_view kYellow = "\033[93m";
constexpr std::string_view kMagenta = "\033[95m";
constexpr std::string_view kBold = "\033[1m";
constexpr std::string_view kReset = "\033[0m";

constexpr std::string_view kRule =
    "--------------------------------------------------";

std::string paint(std::string_view text, std::string_view code, bool enabled) {
    if (!enabled || code.empty()) {
        return std::string{text};
    }
    return std::string{code} + std::string{text} + std::string{kReset};
}

std::string_view glyph(StepStatus status) {
    switch (status) {
        case StepStatus::Passed: return "✓";
        case StepStatus::Failed: return "✖";
        case StepStatus::Skipped: return "-";
        case StepStatus::Undefined: return "?";
        case StepStatus::NotRun: return " ";
    }
    return " ";
}

std::string_view colour_of(StepStatus status) {
    switch (status) {
        case StepStatus::Passed: return kGreen;
        case StepStatus::Failed: return kRed;
        case StepStatus::Skipped: return kYellow;
        case StepStatus::Undefined: return kMagenta;
        case StepStatus::NotRun: return {};
    }
    return {};
}

void append_indented(std::ostringstream& oss, std::string_view body, std::string_view prefix) {
    for (const auto& line : ea::gherkin::text::split_lines(ea::gherkin::text::strip_trailing_newlines(body))) {
        oss << prefix << line << "\n";
    }
}

std::string feature_header(const std::string& name, bool color) {
    return paint("Feature: " + name, kBold, color) + "\n";
}

std::string scenario_header(const std::string& name) {
    return "\n  Scenario: " + name + "\n";
}

std::string step_block(const StepOutcome& outcome, bool color) {
    std::ostringstream oss;
    const auto code = colour_of(outcome.status);
    oss << paint("    " + std::string{glyph(outcome.status)} + " " + outcome.step.keyword + " " +
                     outcome.step.text,
                 code, color)
        << "\n";

    if (outcome.status == StepStatus::Failed) {
        if (outcome.output) {
            oss << paint("      exit code: " + std::to_string(outcome.output->exit_code), code, color)
                << "\n";
            if (!outcome.output->stdout_text.empty()) {
                oss << "      stdout:\n";
                append_indented(oss, outcome.output->stdout_text, "        ");
            }
            if (!outcome.output->stderr_text.empty()) {
                oss << "      stderr:\n";
                append_indented(oss, outcome.output->stderr_text, "        ");
            }
        } else if (!outcome.message.empty()) {
            oss << paint("      " + outcome.message, code, color) << "\n";
        }
    } else if (outcome.status == StepStatus::Undefined && !outcome.message.empty()) {
        oss << paint("      " + outcome.message, code, color) << "\n";
    }
    return oss.str();
}

std::string summary_block(const RunSummary& summary, bool color) {
    std::ostringstream oss;
    oss << "\n" << kRule << "\n";
    oss << paint("Run Summary:", kBold, color) << "\n";
    oss << "  Scenarios: " << summary.scenarios.total << " total, "
        << paint(std::to_string(summary.scenarios.passed) + " passed", kGreen, color) << ", "
        << paint(std::to_string(summary.scenarios.failed) + " failed", kRed, color) << "\n";
    oss << "  Steps:     " << summary.steps.total << " total, "
        << paint(std::to_string(summary.steps.passed) + " passed", kGreen, color) << ", "
        << paint(std::to_string(summary.steps.failed) + " failed", kRed, color) << ", "
        << paint(std::to_string(summary.steps.skipped) + " skipped", kYellow, color) << ", "
        << paint(std::to_string(summary.steps.undefined) + " undefined", kMagenta, color) << "\n";
    oss << kRule << "\n";
    return oss.str();
}

json step_to_json(const StepOutcome& outcome) {
    json step = {
        {"keyword", outcome.step.keyword},
        {"type", std::string{ea::gherkin::to_string(outcome.step.type)}},
        {"text", outcome.step.text},
        {"line", outcome.step.line},
        {"status", std::string{ea::gherkin::to_string(outcome.status)}},
        {"output", nullptr},
    };
    if (outcome.output) {
        step["output"] = json{
            {"exit_code", outcome.output->exit_code},
            {"stdout", outcome.output->stdout_text},
            {"stderr", outcome.output->stderr_text},
        };
    }
    if (!outcome.message.empty()) {
        step["message"] = outcome.message;
    }
    if (!outcome.implementation.empty()) {
        step["implementation"] = outcome.implementation;
    }
    return step;
}

json scenario_to_json(const ScenarioOutcome& outcome) {
    json steps = json::array();
    for (const auto& step : outcome.steps) {
        steps.push_back(step_to_json(step));
    }
    return json{
        {"name", outcome.name},
        {"tags", outcome.tags},
        {"line", outcome.line},
        {"status", std::string{ea::gherkin::to_string(outcome.status)}},
        {"steps", std::move(steps)},
    };
}

json build_report(const RunResult& result) {
    json scenarios = json::array();
    for (const auto& scenario : result.scenarios) {
        scenarios.push_back(scenario_to_json(scenario));
    }

    const auto& counts = result.summary;
    return json{
        {"feature",
         {
             {"name", result.feature_name},
             {"file", result.source},
             {"narrative", result.narrative},
             {"tags", result.tags},
         }},
        {"summary",
         {
             {"scenarios",
              {
                  {"total", counts.scenarios.total},
                  {"passed", counts.scenarios.passed},
                  {"failed", counts.scenarios.failed},
                  {"undefined", counts.scenarios.undefined},
              }},
             {"steps",
              {
                  {"total", counts.steps.total},
                  {"passed", counts.steps.passed},
                  {"failed", counts.steps.failed},
                  {"skipped", counts.steps.skipped},
                  {"undefined", counts.steps.undefined},
              }},
         }},
        {"scenarios", std::move(scenarios)},
    };
}

std::string escape_html(std::string_view input) {
    std::ostringstream oss;
    for (char ch : input) {
        switch (ch) {
            case '&': oss << "&amp;"; break;
            case '<': oss << "&lt;"; break;
            case '>': oss << "&gt;"; break;
            case '"': oss << "&quot;"; break;
            case '\'': oss << "&#39;"; break;
            default: oss << ch;
        }
    }
    return oss.str();
}

std::string output_to_html(const StepOutcome& outcome) {
    if (!outcome.output) {
        return escape_html(outcome.message);
    }
    std::ostringstream oss;
    oss << "exit code " << outcome.output->exit_code;
    if (!outcome.output->stdout_text.empty()) {
        oss << "<pre class=\"stdout\">" << escape_html(outcome.output->stdout_text) << "</pre>";
    }
    if (!outcome.output->stderr_text.empty()) {
        oss << "<pre class=\"stderr\">" << escape_html(outcome.output->stderr_text) << "</pre>";
    }
    return oss.str();
}

std::string html_document(const RunResult& result) {
    std::ostringstream oss;
    oss << "<!DOCTYPE html><html><head><meta charset=\"utf-8\"/>"
        << "<title>" << escape_html(result.feature_name) << "</title>"
        << "<style>"
        << "body{font-family:system-ui, sans-serif;margin:2rem;}"
        << "table{border-collapse:collapse;width:100%;margin-bottom:1.5rem;}"
        << "th,td{border:1px solid #ccc;padding:0.5rem;vertical-align:top;}"
        << "th{background:#f5f5f5;text-align:left;}"
        << "pre{margin:0.25rem 0;white-space:pre-wrap;}"
        << ".status-passed{color:#0a7c2f;font-weight:bold;}"
        << ".status-failed{color:#c1121f;font-weight:bold;}"
        << ".status-skipped{color:#7a7a7a;}"
        << ".status-undefined{color:#b000b5;font-weight:bold;}"
        << "</style></head><body>";

    oss << "<h1>Feature: " << escape_html(result.feature_name) << "</h1>";
    oss << "<p>" << escape_html(result.source) << "</p>";
    if (!result.narrative.empty()) {
        oss << "<pre>" << escape_html(result.narrative) << "</pre>";
    }

    const auto& counts = result.summary;
    oss << "<section><h2>Summary</h2><ul>";
    oss << "<li>Scenarios: " << counts.scenarios.total << " total, " << counts.scenarios.passed
        << " passed, " << counts.scenarios.failed << " failed (" << counts.scenarios.undefined
        << " undefined)</li>";
    oss << "<li>Steps: " << counts.steps.total << " total, " << counts.steps.passed << " passed, "
        << counts.steps.failed << " failed, " << counts.steps.skipped << " skipped, "
        << counts.steps.undefined << " undefined</li>";
    oss << "</ul></section>";

    oss << "<section><h2>Scenarios</h2>";
    for (const auto& scenario : result.scenarios) {
        const std::string status{ea::gherkin::to_string(scenario.status)};
        oss << "<h3>" << escape_html(scenario.name) << " <span class=\"status-" << status << "\">"
            << status << "</span></h3>";
        oss << "<table><thead><tr>"
            << "<th>#</th>"
            << "<th>Keyword</th>"
            << "<th>Step</th>"
            << "<th>Status</th>"
            << "<th>Output</th>"
            << "</tr></thead><tbody>";
        for (std::size_t index = 0; index < scenario.steps.size(); ++index) {
            const auto& step = scenario.steps[index];
            const std::string step_status{ea::gherkin::to_string(step.status)};
            oss << "<tr>";
            oss << "<td>" << (index + 1) << "</td>";
            oss << "<td>" << escape_html(step.step.keyword) << "</td>";
            oss << "<td>" << escape_html(step.step.text) << "</td>";
            oss << "<td class=\"status-" << step_status << "\">" << step_status << "</td>";
            oss << "<td>" << output_to_html(step) << "</td>";
            oss << "</tr>";
        }
        oss << "</tbody></table>";
    }
    oss << "</section>";
    oss << "</body></html>";
    return oss.str();
}

void ensure_parent(const std::filesystem::path& destination) {
    const auto parent = destination.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        std::filesystem::create_directories(parent);
    }
}

void write_file(const std::filesystem::path& destination, const std::string& content) {
    ensure_parent(destination);
    std::ofstream output(destination, std::ios::binary);
    if (!output.is_open()) {
        throw std::runtime_error("Unable to open output file: " + destination.string());
    }
    output << content;
    if (!output) {
        throw std::runtime_error("Unable to write output file: " + destination.string());
    }
}

}  // namespace

namespace ea::gherkin {

std::string ReportWriter::render_text(const RunResult& result, bool color) const {
    std::ostringstream oss;
    oss << feature_header(result.feature_name, color);
    for (const auto& scenario : result.scenarios) {
        oss << scenario_header(scenario.name);
        for (const auto& step : scenario.steps) {
            oss << step_block(step, color);
        }
    }
    oss << summary_block(result.summary, color);
    return oss.str();
}

std::string ReportWriter::render_json(const RunResult& result) const {
    // Step output is arbitrary bytes; invalid UTF-8 becomes U+FFFD instead of throwing.
    return build_report(result).dump(2, ' ', false, json::error_handler_t::replace);
}

std::string ReportWriter::render_html(const RunResult& result) const {
    return html_document(result);
}

void ReportWriter::write_summary(const std::filesystem::path& destination,
                                 const RunResult& result) const {
    write_file(destination, render_json(result) + "\n");
}

void ReportWriter::write_detailed(const std::filesystem::path& destination,
                                  const RunResult& result) const {
    write_file(destination, render_html(result));
}

TextReportListener::TextReportListener(std::ostream& out, bool color) : out_(out), color_(color) {}

void TextReportListener::feature_started(const Feature& feature) {
    out_ << feature_header(feature.name, color_) << std::flush;
}

void TextReportListener::scenario_started(const Scenario& scenario) {
    out_ << scenario_header(scenario.name) << std::flush;
}

void TextReportListener::step_finished(const StepOutcome& outcome) {
    out_ << step_block(outcome, color_) << std::flush;
}

void TextReportListener::run_finished(const RunResult& result) {
    out_ << summary_block(result.summary, color_) << std::flush;
}

}  // namespace ea::gherkin
