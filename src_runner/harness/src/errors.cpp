#include "ea_gherkin/errors.hpp"

#include <string>
#include <utility>

namespace {

std::string locate(const std::string& document, std::size_t line) {
    if (line == 0) {
        return document;
    }
    return document + ":" + std::to_string(line);
}

}  // namespace

namespace ea::gherkin {

ParseError::ParseError(std::string document, std::size_t line, const std::string& message)
    : Error(locate(document, line) + ": " + message),
      document_(std::move(document)),
      line_(line) {}

CatalogError::CatalogError(std::string document,
                           std::size_t line,
                           std::string pattern,
                           const std::string& message)
    : Error(locate(document, line) + ": invalid pattern '" + pattern + "': " + message),
      document_(std::move(document)),
      line_(line),
      pattern_(std::move(pattern)) {}

CatalogError::CatalogError(const std::string& message) : Error(message) {}

}  // namespace ea::gherkin
