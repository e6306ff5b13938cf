#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <unistd.h>

#include "ea_gherkin/engine.hpp"
#include "ea_gherkin/errors.hpp"
#include "ea_gherkin/feature_parser.hpp"
#include "ea_gherkin/implementation_catalog.hpp"
#include "ea_gherkin/interpreter_locator.hpp"
#include "ea_gherkin/logging.hpp"
#include "ea_gherkin/report_writer.hpp"
#include "ea_gherkin/shell_bridge.hpp"
#include "ea_gherkin/source_provider.hpp"
#include "ea_gherkin/step_resolver.hpp"

using ea::gherkin::ConfigError;
using ea::gherkin::DirectorySourceProvider;
using ea::gherkin::Engine;
using ea::gherkin::FeatureParser;
using ea::gherkin::FileSourceProvider;
using ea::gherkin::ImplementationCatalog;
using ea::gherkin::PathInterpreterLocator;
using ea::gherkin::ReportWriter;
using ea::gherkin::RunResult;
using ea::gherkin::SourceDocument;
using ea::gherkin::StepResolver;
using ea::gherkin::TextReportListener;

namespace {

struct Args {
    std::filesystem::path feature_file{};
    std::vector<std::filesystem::path> implementation_files;
    std::filesystem::path impl_dir{"../gherkin-implements"};
    std::filesystem::path summary_path{};
    std::filesystem::path html_path{};
    std::string shell{"bash"};
    int timeout_sec{0};
    bool json{false};
    bool warn_ambiguous{false};
    bool color{true};
    bool debug{false};
    bool help{false};
};

void print_usage(const char* argv0) {
    std::cerr
        << "Gherkin Test Runner with Shell Script Implementations\n"
        << "Usage:\n"
        << "  " << argv0 << " <feature-file> [implementation-file ...]\n"
        << "                 [--impl-dir <dir>] [--json] [--summary <path>] [--html <path>]\n"
        << "                 [--shell <name|path>] [--timeout <seconds>] [--warn-ambiguous]\n"
        << "                 [--no-color] [--debug]\n"
        << "\n"
        << "Options:\n"
        << "  --impl-dir       Directory containing *.gherkin implementation files\n"
        << "                   (default: ../gherkin-implements; ignored when files are given).\n"
        << "  --json           Print the results as JSON instead of the text report.\n"
        << "  --summary        Also write the JSON report to this path.\n"
        << "  --html           Also write an HTML report to this path.\n"
        << "  --shell          Command interpreter used for step scripts (default: bash).\n"
        << "  --timeout        Per-step timeout in seconds (default: 0, no timeout).\n"
        << "  --warn-ambiguous Warn when a step matches more than one implementation.\n"
        << "  --no-color       Disable ANSI colours.\n"
        << "  --debug          Enable debug output.\n"
        << "  -h, --help       Show this help message.\n"
        << "\n"
        << "Environment:\n"
        << "  EA_GHERKIN_LOG_LEVEL  trace|debug|info|warn|error|off (default: info)\n"
        << std::endl;
}

bool arg_eq(std::string_view a, std::string_view b) {
    return a == b;
}

const char* expect_value(int& i, int argc, char** argv, std::string_view option) {
    if (i + 1 >= argc) {
        throw ConfigError(std::string{option} + " expects a value");
    }
    return argv[++i];
}

int parse_timeout(std::string_view raw) {
    try {
        std::size_t consumed = 0;
        const int value = std::stoi(std::string{raw}, &consumed);
        if (consumed == raw.size() && value >= 0) {
            return value;
        }
    } catch (const std::exception&) {
        // reported below
    }
    throw ConfigError("--timeout expects a non-negative number of seconds, got '" + std::string{raw} + "'");
}

Args parse_args(int argc, char** argv) {
    Args args;
    std::vector<std::filesystem::path> positional;
    for (int i = 1; i < argc; ++i) {
        std::string_view tok = argv[i];
        if (arg_eq(tok, "-h") || arg_eq(tok, "--help")) {
            args.help = true;
            return args;
        } else if (arg_eq(tok, "--impl-dir")) {
            args.impl_dir = expect_value(i, argc, argv, tok);
        } else if (arg_eq(tok, "--json")) {
            args.json = true;
        } else if (arg_eq(tok, "--summary")) {
            args.summary_path = expect_value(i, argc, argv, tok);
        } else if (arg_eq(tok, "--html")) {
            args.html_path = expect_value(i, argc, argv, tok);
        } else if (arg_eq(tok, "--shell")) {
            args.shell = expect_value(i, argc, argv, tok);
        } else if (arg_eq(tok, "--timeout")) {
            args.timeout_sec = parse_timeout(expect_value(i, argc, argv, tok));
        } else if (arg_eq(tok, "--warn-ambiguous")) {
            args.warn_ambiguous = true;
        } else if (arg_eq(tok, "--no-color")) {
            args.color = false;
        } else if (arg_eq(tok, "--debug")) {
            args.debug = true;
        } else if (tok.size() > 1 && tok.front() == '-') {
            throw ConfigError("Unknown option: " + std::string{tok});
        } else {
            positional.emplace_back(std::string(tok));
        }
    }

    if (positional.empty()) {
        throw ConfigError("Missing feature file");
    }
    args.feature_file = positional.front();
    args.implementation_files.assign(positional.begin() + 1, positional.end());
    return args;
}

void configure_logging(const Args& args) {
    if (args.debug) {
        ea::gherkin::logging::init(spdlog::level::debug);
        return;
    }
    auto level = ea::gherkin::logging::level_from_environment().value_or(spdlog::level::info);
    if (args.json && !ea::gherkin::logging::level_from_environment()) {
        level = spdlog::level::warn;
    }
    ea::gherkin::logging::init(level);
}

std::vector<SourceDocument> load_sources(const Args& args) {
    if (!args.implementation_files.empty()) {
        return FileSourceProvider(args.implementation_files).documents();
    }
    DirectorySourceProvider provider(args.impl_dir);
    auto documents = provider.documents();
    if (documents.empty()) {
        throw ConfigError("No implementation files found in " + args.impl_dir.string());
    }
    return documents;
}

} // namespace

int main(int argc, char** argv) {
    try {
        const auto args = parse_args(argc, argv);
        if (args.help) {
            print_usage(argv[0]);
            return 0;
        }
        configure_logging(args);
        auto log = ea::gherkin::logging::get();
        log->info("--- Gherkin Test Runner ---");

        // Everything that can fail fatally happens before the first step runs.
        const auto catalog = ImplementationCatalog::compile(load_sources(args));
        const StepResolver resolver(catalog, StepResolver::Options{.warn_ambiguous = args.warn_ambiguous});
        ea::gherkin::shell_bridge::Session session(PathInterpreterLocator(args.shell), args.timeout_sec);
        const auto feature = FeatureParser{}.load(args.feature_file);

        const bool color = args.color && ::isatty(STDOUT_FILENO) == 1;
        std::unique_ptr<TextReportListener> listener;
        if (!args.json) {
            listener = std::make_unique<TextReportListener>(std::cout, color);
        }

        Engine engine(resolver, session, Engine::Config{.listener = listener.get()});
        const RunResult result = engine.run(feature);

        ReportWriter writer;
        if (args.json) {
            std::cout << writer.render_json(result) << std::endl;
        }
        if (!args.summary_path.empty()) {
            writer.write_summary(args.summary_path, result);
            log->info("JSON report: {}", args.summary_path.string());
        }
        if (!args.html_path.empty()) {
            writer.write_detailed(args.html_path, result);
            log->info("HTML report: {}", args.html_path.string());
        }

        return ea::gherkin::exit_code(result);
    } catch (const ConfigError& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        print_usage(argv[0]);
        return 2;
    } catch (const ea::gherkin::Error& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        return 2;
    } catch (const std::exception& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        return 3;
    }
}
