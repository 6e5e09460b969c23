/**
 * @file SizeIndex.hpp
 * @brief Groups scan records by byte size and base filename.
 */

#pragma once
#include <map>
#include <vector>
#include "domain/Catalog.hpp"
#include "domain/FileRecord.hpp"

namespace pdfcatalog::domain {

/** @brief sizeBytes -> records of that size, in discovery order. */
using SizeIndexMap = std::map<long long, std::vector<FileRecord>>;

class SizeIndex {
public:
    /** @brief Buckets records by exact byte size. */
    static SizeIndexMap buildIndex(const std::vector<FileRecord>& records);

    /**
     * @brief Converts the index into a catalog sorted by size.
     * @param duplicatesOnly Drop sizes holding a single record.
     *
     * Base filenames keep their first-seen order inside a size group and
     * locations keep discovery order, so the output is stable for fixed input.
     */
    static Catalog toCatalog(const SizeIndexMap& index, bool duplicatesOnly);

    /** @brief Number of records in sizes holding more than one record. */
    static size_t countDuplicateRecords(const SizeIndexMap& index);
};

} // namespace pdfcatalog::domain
