/**
 * @file SnapshotDiffer.hpp
 * @brief Compares a previous catalog snapshot with the current one.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/Catalog.hpp"

namespace pdfcatalog::domain {

/**
 * @enum DiffKind
 * @brief Category of one change record.
 */
enum class DiffKind {
    Info,                  ///< No previous snapshot exists.
    New,
    Removed,
    MovedTo,               ///< Key gained a folder.
    MovedFrom,             ///< Key lost a folder.
    Modified,              ///< Timestamps changed at an unchanged folder.
    ClassificationChanged
};

/** @brief Stable tag used in console output ("NEW", "MOVED_TO", ...). */
const char* ToString(DiffKind kind);

/**
 * @struct DiffEntry
 * @brief One human-readable change record keyed by (size, filename).
 */
struct DiffEntry {
    DiffKind kind = DiffKind::Info;
    long long sizeBytes = 0;
    std::string filename;
    std::string folder;     ///< MovedTo / MovedFrom / Modified only.
    std::string oldCodes;   ///< ClassificationChanged only.
    std::string newCodes;   ///< ClassificationChanged only.
    std::string message;
};

/**
 * @struct DiffResult
 * @brief Ordered change records. Derived, never persisted.
 */
struct DiffResult {
    bool hasChanges = false;
    std::vector<DiffEntry> entries;

    size_t count(DiffKind kind) const;
};

class SnapshotDiffer {
public:
    /**
     * @brief Diffs two catalogs at (sizeBytes, filename) granularity.
     * @param previous std::nullopt when no earlier scan was saved.
     *
     * Entries are ordered by size, then filename, then folder. Neither input
     * is modified.
     */
    static DiffResult diff(const std::optional<Catalog>& previous, const Catalog& current);

    /** @brief 1234567 -> "1,234,567". */
    static std::string formatBytes(long long value);
};

} // namespace pdfcatalog::domain
