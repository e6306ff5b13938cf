#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace ea::gherkin {

/**
 * \brief Base class of every fatal, run-level error raised by the runner.
 *
 * Step failures and undefined steps are never reported through exceptions; they are
 * outcomes recorded in the run result.
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * \brief Malformed feature or implementation document.
 *
 * The message is prefixed with `<document>:<line>: ` so it can be printed as-is.
 * A line of 0 refers to the document as a whole (e.g. it could not be read).
 */
class ParseError : public Error {
public:
    ParseError(std::string document, std::size_t line, const std::string& message);

    [[nodiscard]] const std::string& document() const noexcept { return document_; }
    [[nodiscard]] std::size_t line() const noexcept { return line_; }

private:
    std::string document_;
    std::size_t line_;
};

/**
 * \brief The implementation catalog could not be compiled (invalid pattern, no entries).
 */
class CatalogError : public Error {
public:
    CatalogError(std::string document, std::size_t line, std::string pattern,
                 const std::string& message);
    explicit CatalogError(const std::string& message);

    [[nodiscard]] const std::string& document() const noexcept { return document_; }
    [[nodiscard]] std::size_t line() const noexcept { return line_; }
    [[nodiscard]] const std::string& pattern() const noexcept { return pattern_; }

private:
    std::string document_;
    std::size_t line_{0};
    std::string pattern_;
};

/**
 * \brief The command interpreter could not be located or launched.
 */
class LaunchError : public Error {
public:
    using Error::Error;
};

/**
 * \brief Invalid command line or missing inputs.
 */
class ConfigError : public Error {
public:
    using Error::Error;
};

}  // namespace ea::gherkin
