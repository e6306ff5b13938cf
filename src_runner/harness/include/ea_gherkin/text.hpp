#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace ea::gherkin::text {

constexpr std::string_view kWhitespace = " \t\n\r\f\v";

[[nodiscard]] std::string trim_copy(std::string_view input);

[[nodiscard]] std::string rtrim_copy(std::string_view input);

[[nodiscard]] std::string to_lower_copy(std::string_view input);

/// CRLF and lone CR become LF.
[[nodiscard]] std::string normalize_line_endings(std::string_view input);

/// Splits on LF. A trailing LF does not produce an extra empty line.
[[nodiscard]] std::vector<std::string> split_lines(std::string_view input);

/// Removes trailing LF characters, the way `$(...)` does in a POSIX shell.
[[nodiscard]] std::string strip_trailing_newlines(std::string_view input);

/// Reads a whole file. Throws ParseError (line 0) when it cannot be opened or read.
[[nodiscard]] std::string read_document(const std::filesystem::path& file);

}  // namespace ea::gherkin::text
