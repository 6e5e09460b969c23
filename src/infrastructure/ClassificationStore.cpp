/**
 * @file ClassificationStore.cpp
 * @brief Implementation of ClassificationStore.
 */

#include "infrastructure/ClassificationStore.hpp"
#include "domain/Errors.hpp"
#include "domain/Timestamp.hpp"
#include "infrastructure/Log.hpp"
#include "infrastructure/PersistenceService.hpp"
#include <algorithm>
#include <chrono>
#include <nlohmann/json.hpp>
#include <set>

namespace pdfcatalog::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

ClassificationStore::ClassificationStore(fs::path path) : m_path(std::move(path)) {}

bool ClassificationStore::exists() const {
    return PersistenceService::exists(m_path);
}

std::vector<domain::ClassificationEntry> ClassificationStore::load() const {
    if (!exists()) {
        throw domain::NotFoundError("Classification document not found at " + m_path.string());
    }

    json j;
    try {
        j = json::parse(PersistenceService::readText(m_path));
    } catch (const json::exception& e) {
        throw domain::FormatError("Cannot parse " + m_path.string() + ": " + e.what());
    }

    if (!j.is_object() || !j.contains("ToK") || !j["ToK"].is_array()) {
        throw domain::FormatError("'ToK' list not found in " + m_path.string());
    }

    std::vector<domain::ClassificationEntry> entries;
    std::set<std::string> seen;
    for (const auto& item : j["ToK"]) {
        if (!item.is_object() || !item.contains("prefix") || !item["prefix"].is_string() ||
            !item.contains("string") || !item["string"].is_string()) {
            throw domain::FormatError("ToK entry without 'prefix'/'string' in " + m_path.string());
        }
        domain::ClassificationEntry entry{item["prefix"].get<std::string>(), item["string"].get<std::string>()};
        if (!seen.insert(entry.code).second) {
            Log::Warn("ClassificationStore", "Duplicate ToK code '" + entry.code + "' in " + m_path.string());
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

std::optional<fs::path> ClassificationStore::save(std::vector<domain::ClassificationEntry> entries) const {
    std::stable_sort(entries.begin(), entries.end(),
                     [](const domain::ClassificationEntry& a, const domain::ClassificationEntry& b) { return a.code < b.code; });

    std::optional<fs::path> backup;
    if (exists()) {
        fs::path target = PersistenceService::uniqueBackupPath(
            m_path.parent_path(), m_path.stem().string(),
            domain::FormatBackupStamp(std::chrono::system_clock::now()), m_path.extension().string());
        std::error_code ec;
        fs::rename(m_path, target, ec);
        if (ec) {
            throw domain::IOError("Cannot move " + m_path.string() + " aside: " + ec.message());
        }
        backup = target;
    }

    json list = json::array();
    for (const auto& entry : entries) {
        list.push_back({{"prefix", entry.code}, {"string", entry.label}});
    }
    json doc = {{"ToK", list}};

    try {
        PersistenceService::writeTextAtomic(m_path, doc.dump(4, ' ', false, json::error_handler_t::replace) + "\n");
    } catch (const domain::IOError&) {
        if (backup) {
            // Put the authoritative copy back so the live path is never left empty.
            std::error_code restoreEc;
            fs::rename(*backup, m_path, restoreEc);
            if (restoreEc) {
                Log::Error("ClassificationStore", "Could not restore " + backup->string() + ": " + restoreEc.message());
            }
        }
        throw;
    }

    Log::Info("ClassificationStore", "Saved " + std::to_string(entries.size()) + " ToK entries" +
              (backup ? " (backup: " + backup->filename().string() + ")" : std::string()));
    return backup;
}

} // namespace pdfcatalog::infrastructure
