/**
 * @file FileRecord.hpp
 * @brief Domain entity for one PDF found during a library scan.
 */

#pragma once
#include <chrono>
#include <string>

namespace pdfcatalog::domain {

/** @brief Folder token used when a file sits directly in the scanned root. */
inline constexpr const char* kRootFolderToken = "[root]";

/**
 * @struct FileRecord
 * @brief Raw per-file scan result. Never persisted individually.
 */
struct FileRecord {
    std::string baseFilename;        ///< Filename with the classification prefix stripped.
    std::string classificationCode;  ///< Code without separators (e.g. "AB"), empty for bare files.
    std::string folder;              ///< Folder relative to the scan root, or kRootFolderToken.
    long long sizeBytes = 0;
    std::chrono::system_clock::time_point createdAt;
    std::chrono::system_clock::time_point modifiedAt;
};

/**
 * @struct PatternedFile
 * @brief Result row of the patterned-only scan.
 */
struct PatternedFile {
    std::string prefix;         ///< Matched prefix, e.g. "A B C".
    std::string baseFilename;
    std::string folder;
    std::string internalTitle;  ///< PDF title metadata, empty if absent, "[Error: ...]" if unreadable.
};

} // namespace pdfcatalog::domain
