/**
 * @file FilesystemScanner.hpp
 * @brief Walks the PDF library and produces per-file scan records.
 */

#pragma once
#include <filesystem>
#include <functional>
#include <set>
#include <string>
#include <vector>
#include "domain/BarePdfIndex.hpp"
#include "domain/FileRecord.hpp"

namespace pdfcatalog::infrastructure {

/**
 * @class FilesystemScanner
 * @brief Infrastructure adapter over std::filesystem for the library tree.
 *
 * Directories whose name is in the exclude set are never descended into.
 * A file that cannot be stat'ed is logged and skipped; one bad file never
 * aborts the walk.
 */
class FilesystemScanner {
public:
    /** @brief Reads a PDF title; swapped out in tests. */
    using TitleReader = std::function<std::string(const std::string&)>;

    FilesystemScanner(std::filesystem::path root, std::set<std::string> excludeDirNames);

    /**
     * @brief Scans every PDF below the root.
     * @return Records in traversal order.
     * @throws domain::NotFoundError if the root is not a directory.
     */
    std::vector<domain::FileRecord> scan() const;

    /** @brief Scans only prefixed PDFs and reads their embedded title. */
    std::vector<domain::PatternedFile> scanPatternedOnly() const;

    /**
     * @brief Lists bare PDFs directly inside folder, newest modification first.
     * @throws domain::NotFoundError if folder is not a directory.
     */
    static domain::BarePdfIndex listBareFiles(const std::filesystem::path& folder);

    void setTitleReader(TitleReader reader) { m_titleReader = std::move(reader); }

    const std::filesystem::path& root() const { return m_root; }

    /** @brief Case-insensitive ".pdf" suffix check. */
    static bool isPdfName(const std::string& filename);

private:
    using FileVisitor = std::function<void(const std::filesystem::path& file, const std::string& relativeFolder)>;

    void walk(const std::filesystem::path& dir, const FileVisitor& visitor) const;
    std::string relativeFolder(const std::filesystem::path& dir) const;
    void requireRoot() const;

    std::filesystem::path m_root;
    std::set<std::string> m_excludeDirNames;
    TitleReader m_titleReader;
};

} // namespace pdfcatalog::infrastructure
