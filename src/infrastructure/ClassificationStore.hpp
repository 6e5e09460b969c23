/**
 * @file ClassificationStore.hpp
 * @brief JSON persistence of the classification (ToK) entry list.
 */

#pragma once
#include <filesystem>
#include <optional>
#include <vector>
#include "domain/Classification.hpp"

namespace pdfcatalog::infrastructure {

/**
 * @class ClassificationStore
 * @brief Reads and writes {"ToK": [{"prefix": code, "string": label}, ...]}.
 *
 * The document is the only copy of user-entered labels, so a save moves the
 * prior document aside (rename, not copy) before writing the new one.
 */
class ClassificationStore {
public:
    explicit ClassificationStore(std::filesystem::path path);

    /**
     * @throws domain::NotFoundError if the document does not exist.
     * @throws domain::FormatError if it has no "ToK" list or an entry lacks a field.
     */
    std::vector<domain::ClassificationEntry> load() const;

    /**
     * @brief Writes entries sorted by code.
     * @return Path the prior document was moved to, if one existed.
     * @throws domain::IOError if the prior document cannot be moved aside or the
     * write fails. Nothing is written when the move fails.
     */
    std::optional<std::filesystem::path> save(std::vector<domain::ClassificationEntry> entries) const;

    const std::filesystem::path& path() const { return m_path; }
    bool exists() const;

private:
    std::filesystem::path m_path;
};

} // namespace pdfcatalog::infrastructure
