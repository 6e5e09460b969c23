/**
 * @file ClassificationService.hpp
 * @brief Validated editing of the classification (ToK) entry list.
 */

#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "domain/Classification.hpp"
#include "domain/ToKHierarchy.hpp"
#include "infrastructure/ClassificationStore.hpp"

namespace pdfcatalog::application {

/**
 * @class ClassificationService
 * @brief Owns the flat entry list; every mutation is saved (with backup) and
 * the tree view is rebuilt from the list afterwards.
 *
 * Entries are addressed by their code as it was when the edit started, never
 * by label, since labels may repeat.
 */
class ClassificationService {
public:
    explicit ClassificationService(infrastructure::ClassificationStore store);

    /** @brief (Re)reads the document. Throws NotFoundError / FormatError. */
    void reload();

    /** @brief Loads on first use. */
    const std::vector<domain::ClassificationEntry>& entries();

    /** @brief Forest rebuilt from the current entries. */
    const domain::ToKHierarchy& tree();

    std::optional<domain::ClassificationEntry> find(const std::string& code);

    /**
     * @brief Adds an entry, creating the document if it does not exist yet.
     * @return Backup path of the prior document, if any.
     * @throws domain::ValidationError for an empty/non-alphanumeric code, an
     * empty label, or a code already in use.
     */
    std::optional<std::filesystem::path> add(const std::string& code, const std::string& label);

    /**
     * @brief Changes the code and/or label of the entry originally coded originalCode.
     * Spaces in newCode are removed ("A B" -> "AB").
     * @throws domain::NotFoundError if originalCode is unknown.
     * @throws domain::ValidationError on an invalid or colliding new code.
     */
    std::optional<std::filesystem::path> update(const std::string& originalCode,
                                                const std::string& newCode,
                                                const std::string& newLabel);

    /**
     * @brief Removes an entry.
     * @return The removed entry.
     * @throws domain::NotFoundError if code is unknown.
     */
    domain::ClassificationEntry remove(const std::string& code);

    /** @brief Path the last mutation moved the prior document to. */
    const std::optional<std::filesystem::path>& lastBackup() const { return m_lastBackup; }

    const std::filesystem::path& documentPath() const { return m_store.path(); }

    /** @brief Strips surrounding whitespace. */
    static std::string trim(const std::string& value);

private:
    void ensureLoaded();
    void commit(std::vector<domain::ClassificationEntry> next);

    infrastructure::ClassificationStore m_store;
    std::vector<domain::ClassificationEntry> m_entries;
    domain::ToKHierarchy m_tree;
    std::optional<std::filesystem::path> m_lastBackup;
    bool m_loaded = false;
};

} // namespace pdfcatalog::application
