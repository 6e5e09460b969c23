/**
 * @file Catalog.cpp
 * @brief Catalog value helpers.
 */

#include "domain/Catalog.hpp"
#include <sstream>

namespace pdfcatalog::domain {

std::string FileGroup::codesString() const {
    std::string joined;
    for (const auto& code : codes) {
        if (!joined.empty()) joined += ";";
        joined += code;
    }
    return joined;
}

CatalogStats ComputeStats(const Catalog& catalog) {
    CatalogStats stats;
    stats.sizeGroups = catalog.size();
    for (const auto& group : catalog) {
        stats.fileEntries += group.files.size();
        for (const auto& file : group.files) {
            stats.totalLocations += file.locations.size();
        }
    }
    return stats;
}

std::set<std::string> ParseCodesString(const std::string& joined) {
    std::set<std::string> codes;
    std::stringstream ss(joined);
    std::string part;
    while (std::getline(ss, part, ';')) {
        if (!part.empty()) codes.insert(part);
    }
    return codes;
}

} // namespace pdfcatalog::domain
