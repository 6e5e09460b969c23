/**
 * @file ClassificationService.cpp
 * @brief Implementation of ClassificationService.
 */

#include "application/ClassificationService.hpp"
#include "domain/Errors.hpp"
#include "domain/PrefixCodec.hpp"
#include "infrastructure/Log.hpp"
#include <algorithm>
#include <sstream>

namespace pdfcatalog::application {

using domain::ClassificationEntry;

namespace {

bool SameCode(const ClassificationEntry& entry, const std::string& code) {
    return entry.code == code;
}

} // namespace

ClassificationService::ClassificationService(infrastructure::ClassificationStore store)
    : m_store(std::move(store)) {}

std::string ClassificationService::trim(const std::string& value) {
    size_t first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

void ClassificationService::reload() {
    m_entries = m_store.load();
    std::stable_sort(m_entries.begin(), m_entries.end(),
                     [](const ClassificationEntry& a, const ClassificationEntry& b) { return a.code < b.code; });
    m_tree = domain::ToKHierarchy::buildTree(m_entries);
    m_loaded = true;
}

void ClassificationService::ensureLoaded() {
    if (!m_loaded) reload();
}

const std::vector<ClassificationEntry>& ClassificationService::entries() {
    ensureLoaded();
    return m_entries;
}

const domain::ToKHierarchy& ClassificationService::tree() {
    ensureLoaded();
    return m_tree;
}

std::optional<ClassificationEntry> ClassificationService::find(const std::string& code) {
    ensureLoaded();
    auto it = std::find_if(m_entries.begin(), m_entries.end(),
                           [&code](const ClassificationEntry& e) { return SameCode(e, code); });
    if (it == m_entries.end()) return std::nullopt;
    return *it;
}

void ClassificationService::commit(std::vector<ClassificationEntry> next) {
    std::stable_sort(next.begin(), next.end(),
                     [](const ClassificationEntry& a, const ClassificationEntry& b) { return a.code < b.code; });
    // The store moves the old document aside first; in-memory state only
    // changes once the new document is on disk.
    m_lastBackup = m_store.save(next);
    m_entries = std::move(next);
    m_tree = domain::ToKHierarchy::buildTree(m_entries);
}

std::optional<std::filesystem::path> ClassificationService::add(const std::string& code, const std::string& label) {
    if (!m_loaded && !m_store.exists()) {
        // First entry creates the document.
        m_entries.clear();
        m_loaded = true;
    }
    ensureLoaded();
    const std::string cleanCode = trim(code);
    const std::string cleanLabel = trim(label);

    if (!domain::PrefixCodec::isValidCode(cleanCode)) {
        throw domain::ValidationError("ToK code must be alphanumeric only: '" + cleanCode + "'");
    }
    if (cleanLabel.empty()) {
        throw domain::ValidationError("ToK label cannot be empty.");
    }
    if (find(cleanCode)) {
        throw domain::ValidationError("ToK code '" + cleanCode + "' already exists.");
    }

    std::vector<ClassificationEntry> next = m_entries;
    next.push_back({cleanCode, cleanLabel});
    commit(std::move(next));
    infrastructure::Log::Info("ClassificationService", "Added ToK: '" + cleanCode + "' - '" + cleanLabel + "'");
    return m_lastBackup;
}

std::optional<std::filesystem::path> ClassificationService::update(const std::string& originalCode,
                                                                    const std::string& newCode,
                                                                    const std::string& newLabel) {
    ensureLoaded();
    const std::string cleanLabel = trim(newLabel);
    const std::string trimmedCode = trim(newCode);

    if (trimmedCode.empty() || cleanLabel.empty()) {
        throw domain::ValidationError("ToK code and label cannot be empty.");
    }

    std::istringstream parts(trimmedCode);
    std::string part;
    std::string cleanCode;
    while (parts >> part) {
        if (!domain::PrefixCodec::isValidCode(part)) {
            throw domain::ValidationError("ToK code must contain only alphanumeric characters and spaces.");
        }
        cleanCode += part;
    }

    auto original = std::find_if(m_entries.begin(), m_entries.end(),
                                 [&originalCode](const ClassificationEntry& e) { return SameCode(e, originalCode); });
    if (original == m_entries.end()) {
        throw domain::NotFoundError("ToK code '" + originalCode + "' not found.");
    }
    if (cleanCode != originalCode && find(cleanCode)) {
        throw domain::ValidationError("ToK code '" + cleanCode + "' already exists.");
    }

    std::vector<ClassificationEntry> next = m_entries;
    auto target = next.begin() + (original - m_entries.begin());
    target->code = cleanCode;
    target->label = cleanLabel;
    commit(std::move(next));
    infrastructure::Log::Info("ClassificationService", "Updated ToK: '" + originalCode + "' -> '" + cleanCode +
                              "' - '" + cleanLabel + "'");
    return m_lastBackup;
}

ClassificationEntry ClassificationService::remove(const std::string& code) {
    ensureLoaded();
    const std::string cleanCode = trim(code);

    auto it = std::find_if(m_entries.begin(), m_entries.end(),
                           [&cleanCode](const ClassificationEntry& e) { return SameCode(e, cleanCode); });
    if (it == m_entries.end()) {
        throw domain::NotFoundError("ToK code '" + cleanCode + "' not found.");
    }

    ClassificationEntry removed = *it;
    std::vector<ClassificationEntry> next = m_entries;
    next.erase(next.begin() + (it - m_entries.begin()));
    commit(std::move(next));
    infrastructure::Log::Info("ClassificationService", "Deleted ToK: '" + cleanCode + "'");
    return removed;
}

} // namespace pdfcatalog::application
