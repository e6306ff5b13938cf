#include "ea_gherkin/interpreter_locator.hpp"
#include "ea_gherkin/errors.hpp"
#include "ea_gherkin/logging.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include <unistd.h>

namespace fs = std::filesystem;

namespace {

bool is_executable_file(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
}

}  // namespace

namespace ea::gherkin {

PathInterpreterLocator::PathInterpreterLocator(std::string name) : name_(std::move(name)) {}

fs::path PathInterpreterLocator::locate() const {
    if (name_.empty()) {
        throw LaunchError("No command interpreter configured");
    }

    if (name_.find('/') != std::string::npos) {
        const fs::path candidate{name_};
        if (!is_executable_file(candidate)) {
            throw LaunchError("Command interpreter is not executable: " + name_);
        }
        return candidate;
    }

    const char* path_env = std::getenv("PATH");
    const std::string_view search{path_env != nullptr ? path_env : "/usr/bin:/bin"};

    std::size_t start = 0;
    while (start <= search.size()) {
        auto end = search.find(':', start);
        if (end == std::string_view::npos) {
            end = search.size();
        }
        auto dir = search.substr(start, end - start);
        const fs::path candidate = fs::path(dir.empty() ? "." : std::string{dir}) / name_;
        if (is_executable_file(candidate)) {
            logging::get()->debug("Using command interpreter: {}", candidate.string());
            return candidate;
        }
        start = end + 1;
    }

    throw LaunchError("A suitable command interpreter '" + name_ + "' was not found in PATH");
}

}  // namespace ea::gherkin
