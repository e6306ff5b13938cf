#include "ea_gherkin/text.hpp"
#include "ea_gherkin/errors.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace ea::gherkin::text {

std::string trim_copy(std::string_view input) {
    const auto begin = input.find_first_not_of(kWhitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(kWhitespace);
    return std::string{input.substr(begin, end - begin + 1)};
}

std::string rtrim_copy(std::string_view input) {
    const auto end = input.find_last_not_of(kWhitespace);
    if (end == std::string_view::npos) {
        return {};
    }
    return std::string{input.substr(0, end + 1)};
}

std::string to_lower_copy(std::string_view input) {
    std::string result;
    result.reserve(input.size());
    for (unsigned char ch : input) {
        result.push_back(static_cast<char>(std::tolower(ch)));
    }
    return result;
}

std::string normalize_line_endings(std::string_view input) {
    std::string result;
    result.reserve(input.size());
    for (std::size_t i = 0; i < input.size(); ++i) {
        const char ch = input[i];
        if (ch == '\r') {
            result.push_back('\n');
            if (i + 1 < input.size() && input[i + 1] == '\n') {
                ++i;
            }
        } else {
            result.push_back(ch);
        }
    }
    return result;
}

std::vector<std::string> split_lines(std::string_view input) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < input.size()) {
        const auto end = input.find('\n', start);
        if (end == std::string_view::npos) {
            lines.emplace_back(input.substr(start));
            break;
        }
        lines.emplace_back(input.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

std::string strip_trailing_newlines(std::string_view input) {
    auto end = input.size();
    while (end > 0 && input[end - 1] == '\n') {
        --end;
    }
    return std::string{input.substr(0, end)};
}

std::string read_document(const std::filesystem::path& file) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec)) {
        throw ParseError(file.string(), 0, "not a readable regular file");
    }
    std::ifstream input(file, std::ios::binary);
    if (!input.is_open()) {
        throw ParseError(file.string(), 0, "unable to open file");
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    if (input.bad()) {
        throw ParseError(file.string(), 0, "read error");
    }
    return buffer.str();
}

}  // namespace ea::gherkin::text
