/**
 * @file Catalog.hpp
 * @brief Size-indexed catalog snapshot: the persisted unit of a library scan.
 */

#pragma once
#include <set>
#include <string>
#include <vector>

namespace pdfcatalog::domain {

/**
 * @struct Location
 * @brief One place where a base filename was found.
 */
struct Location {
    std::string folder;
    std::string created;   ///< "YYYY-MM-DD HH:MM:SS"
    std::string modified;  ///< "YYYY-MM-DD HH:MM:SS"

    bool operator==(const Location& other) const {
        return folder == other.folder && created == other.created && modified == other.modified;
    }
};

/**
 * @struct FileGroup
 * @brief All locations of one base filename within a size group.
 */
struct FileGroup {
    std::string filename;
    std::set<std::string> codes;      ///< Classification codes seen across locations.
    std::vector<Location> locations;  ///< In scanner discovery order.

    /** @brief Sorted codes joined with ';', "" when none. */
    std::string codesString() const;
};

/**
 * @struct SizeGroup
 * @brief Every file of one exact byte size. All locations share sizeBytes.
 */
struct SizeGroup {
    long long sizeBytes = 0;
    std::vector<FileGroup> files;
};

/** @brief Size groups sorted by sizeBytes ascending. */
using Catalog = std::vector<SizeGroup>;

/**
 * @struct CatalogStats
 * @brief Counts reported after writing a catalog.
 */
struct CatalogStats {
    size_t sizeGroups = 0;
    size_t fileEntries = 0;     ///< Distinct base filenames summed over size groups.
    size_t totalLocations = 0;
};

CatalogStats ComputeStats(const Catalog& catalog);

/** @brief Splits a persisted "A;B" codes string back into a set. */
std::set<std::string> ParseCodesString(const std::string& joined);

} // namespace pdfcatalog::domain
