/**
 * @file SizeIndex.cpp
 * @brief Implementation of SizeIndex.
 */

#include "domain/SizeIndex.hpp"
#include "domain/Timestamp.hpp"
#include <unordered_map>

namespace pdfcatalog::domain {

SizeIndexMap SizeIndex::buildIndex(const std::vector<FileRecord>& records) {
    SizeIndexMap index;
    for (const auto& record : records) {
        index[record.sizeBytes].push_back(record);
    }
    return index;
}

Catalog SizeIndex::toCatalog(const SizeIndexMap& index, bool duplicatesOnly) {
    Catalog catalog;
    for (const auto& [size, records] : index) {
        if (duplicatesOnly && records.size() < 2) {
            continue;
        }

        SizeGroup group;
        group.sizeBytes = size;
        std::unordered_map<std::string, size_t> slotByName;

        for (const auto& record : records) {
            auto it = slotByName.find(record.baseFilename);
            if (it == slotByName.end()) {
                it = slotByName.emplace(record.baseFilename, group.files.size()).first;
                FileGroup file;
                file.filename = record.baseFilename;
                group.files.push_back(std::move(file));
            }

            FileGroup& file = group.files[it->second];
            if (!record.classificationCode.empty()) {
                file.codes.insert(record.classificationCode);
            }
            file.locations.push_back({record.folder,
                                      FormatTimestamp(record.createdAt),
                                      FormatTimestamp(record.modifiedAt)});
        }
        catalog.push_back(std::move(group));
    }
    return catalog;
}

size_t SizeIndex::countDuplicateRecords(const SizeIndexMap& index) {
    size_t count = 0;
    for (const auto& [size, records] : index) {
        if (records.size() > 1) count += records.size();
    }
    return count;
}

} // namespace pdfcatalog::domain
