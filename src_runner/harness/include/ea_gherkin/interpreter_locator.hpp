#pragma once

#include <filesystem>
#include <string>

namespace ea::gherkin {

/**
 * \brief Finds the POSIX-compatible command interpreter used to run step scripts.
 */
class InterpreterLocator {
public:
    virtual ~InterpreterLocator() = default;

    /// Absolute path of an executable interpreter. Throws LaunchError when there is none.
    [[nodiscard]] virtual std::filesystem::path locate() const = 0;
};

/**
 * \brief Resolves an interpreter by name through `PATH`, or checks an explicit path.
 *
 * A name containing `/` is taken as a path and only checked for being executable.
 */
class PathInterpreterLocator final : public InterpreterLocator {
public:
    explicit PathInterpreterLocator(std::string name = "bash");

    [[nodiscard]] std::filesystem::path locate() const override;

private:
    std::string name_;
};

}  // namespace ea::gherkin
