/**
 * @file CatalogStore.hpp
 * @brief JSON persistence of the size-indexed catalog snapshot.
 */

#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/Catalog.hpp"

namespace pdfcatalog::infrastructure {

/**
 * @class CatalogStore
 * @brief Loads and saves the catalog document.
 *
 * Document layout: an array of {"size", "files": [{"filename", "ToK",
 * "locations": [{"folder", "created", "modified"}]}]} sorted by size.
 * Backups are copies kept in a "<stem>-old-files" folder beside the document.
 */
class CatalogStore {
public:
    /**
     * @struct SaveResult
     * @brief Outcome of a save.
     */
    struct SaveResult {
        std::filesystem::path writtenPath;
        std::optional<std::filesystem::path> backupPath;
        domain::CatalogStats stats;
    };

    /**
     * @brief Loads a catalog document.
     * @return std::nullopt if no document exists at path.
     * @throws domain::FormatError if the document cannot be parsed as a catalog.
     */
    static std::optional<domain::Catalog> load(const std::filesystem::path& path);

    /**
     * @brief Writes the catalog, copying any existing document to a timestamped
     * backup first when makeBackup is set.
     * @throws domain::IOError if the backup or the write fails; a failed backup
     * leaves the existing document untouched.
     */
    static SaveResult save(const domain::Catalog& catalog, const std::filesystem::path& path, bool makeBackup);

    /** @brief "<dir>/<stem>-old-files" for a document path. */
    static std::filesystem::path backupFolderFor(const std::filesystem::path& path);

    static nlohmann::json toJson(const domain::Catalog& catalog);
    /** @throws domain::FormatError on a missing or mistyped field. */
    static domain::Catalog fromJson(const nlohmann::json& j);
};

} // namespace pdfcatalog::infrastructure
