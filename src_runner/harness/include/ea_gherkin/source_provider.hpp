#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace ea::gherkin {

/**
 * \brief One implementation document, already read into memory.
 */
struct SourceDocument {
    std::string id;    ///< Provenance, usually the file path
    std::string text;
};

/**
 * \brief Supplies the implementation documents a catalog is built from.
 *
 * The order of the returned documents is the catalog order and therefore decides which
 * entry wins when several patterns match the same step.
 */
class SourceProvider {
public:
    virtual ~SourceProvider() = default;

    [[nodiscard]] virtual std::vector<SourceDocument> documents() const = 0;
};

/**
 * \brief Lists `*<extension>` files directly inside a directory, sorted by file name.
 *
 * A missing directory yields no documents; the caller decides whether that is fatal.
 */
class DirectorySourceProvider final : public SourceProvider {
public:
    explicit DirectorySourceProvider(std::filesystem::path root, std::string extension = ".gherkin");

    [[nodiscard]] std::vector<SourceDocument> documents() const override;

    [[nodiscard]] std::vector<std::filesystem::path> files() const;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::filesystem::path root_;
    std::string extension_;
};

/**
 * \brief Reads exactly the given files, in the given order.
 */
class FileSourceProvider final : public SourceProvider {
public:
    explicit FileSourceProvider(std::vector<std::filesystem::path> files);

    [[nodiscard]] std::vector<SourceDocument> documents() const override;

private:
    std::vector<std::filesystem::path> files_;
};

}  // namespace ea::gherkin
