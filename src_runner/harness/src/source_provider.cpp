#include "ea_gherkin/source_provider.hpp"
#include "ea_gherkin/logging.hpp"
#include "ea_gherkin/text.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace ea::gherkin {

DirectorySourceProvider::DirectorySourceProvider(std::filesystem::path root, std::string extension)
    : root_(std::move(root)), extension_(std::move(extension)) {}

std::vector<std::filesystem::path> DirectorySourceProvider::files() const {
    auto log = logging::get();

    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec)) {
        log->debug("Implementation directory does not exist: {}", root_.string());
        return {};
    }

    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(root_)) {
        if (entry.is_regular_file() && entry.path().extension() == extension_) {
            files.emplace_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    log->debug("Found {} implementation file(s) in {}", files.size(),
               std::filesystem::absolute(root_, ec).string());
    for (const auto& file : files) {
        log->debug("  - {}", file.filename().string());
    }
    return files;
}

std::vector<SourceDocument> DirectorySourceProvider::documents() const {
    return FileSourceProvider(files()).documents();
}

FileSourceProvider::FileSourceProvider(std::vector<std::filesystem::path> files)
    : files_(std::move(files)) {}

std::vector<SourceDocument> FileSourceProvider::documents() const {
    std::vector<SourceDocument> documents;
    documents.reserve(files_.size());
    for (const auto& file : files_) {
        documents.push_back(SourceDocument{file.string(), text::read_document(file)});
    }
    return documents;
}

}  // namespace ea::gherkin
