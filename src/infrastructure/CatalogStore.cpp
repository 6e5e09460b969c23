/**
 * @file CatalogStore.cpp
 * @brief Implementation of CatalogStore.
 */

#include "infrastructure/CatalogStore.hpp"
#include "domain/Errors.hpp"
#include "domain/Timestamp.hpp"
#include "infrastructure/Log.hpp"
#include "infrastructure/PersistenceService.hpp"
#include <algorithm>
#include <chrono>

namespace pdfcatalog::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

const json& Require(const json& obj, const char* key, const char* context) {
    if (!obj.is_object() || !obj.contains(key)) {
        throw domain::FormatError(std::string("Missing '") + key + "' in " + context);
    }
    return obj[key];
}

std::string RequireString(const json& obj, const char* key, const char* context) {
    const json& value = Require(obj, key, context);
    if (!value.is_string()) {
        throw domain::FormatError(std::string("'") + key + "' in " + context + " must be a string");
    }
    return value.get<std::string>();
}

} // namespace

fs::path CatalogStore::backupFolderFor(const fs::path& path) {
    return path.parent_path() / (path.stem().string() + "-old-files");
}

json CatalogStore::toJson(const domain::Catalog& catalog) {
    json root = json::array();
    for (const auto& group : catalog) {
        json files = json::array();
        for (const auto& file : group.files) {
            json locations = json::array();
            for (const auto& loc : file.locations) {
                locations.push_back({{"folder", loc.folder}, {"created", loc.created}, {"modified", loc.modified}});
            }
            files.push_back({{"filename", file.filename}, {"ToK", file.codesString()}, {"locations", locations}});
        }
        root.push_back({{"size", group.sizeBytes}, {"files", files}});
    }
    return root;
}

domain::Catalog CatalogStore::fromJson(const json& j) {
    if (!j.is_array()) {
        throw domain::FormatError("Catalog document must be a JSON array");
    }

    domain::Catalog catalog;
    catalog.reserve(j.size());
    for (const auto& groupJson : j) {
        const json& size = Require(groupJson, "size", "size group");
        if (!size.is_number_integer()) {
            throw domain::FormatError("'size' in size group must be an integer");
        }
        const json& files = Require(groupJson, "files", "size group");
        if (!files.is_array()) {
            throw domain::FormatError("'files' in size group must be an array");
        }

        domain::SizeGroup group;
        group.sizeBytes = size.get<long long>();
        for (const auto& fileJson : files) {
            domain::FileGroup file;
            file.filename = RequireString(fileJson, "filename", "file entry");
            // Documents written before classification tracking have no ToK field.
            if (fileJson.contains("ToK")) {
                if (!fileJson["ToK"].is_string()) {
                    throw domain::FormatError("'ToK' in file entry must be a string");
                }
                file.codes = domain::ParseCodesString(fileJson["ToK"].get<std::string>());
            }
            const json& locations = Require(fileJson, "locations", "file entry");
            if (!locations.is_array()) {
                throw domain::FormatError("'locations' in file entry must be an array");
            }
            for (const auto& locJson : locations) {
                domain::Location loc;
                loc.folder = RequireString(locJson, "folder", "location");
                loc.created = RequireString(locJson, "created", "location");
                loc.modified = RequireString(locJson, "modified", "location");
                file.locations.push_back(std::move(loc));
            }
            group.files.push_back(std::move(file));
        }
        catalog.push_back(std::move(group));
    }

    std::stable_sort(catalog.begin(), catalog.end(),
                     [](const domain::SizeGroup& a, const domain::SizeGroup& b) { return a.sizeBytes < b.sizeBytes; });
    return catalog;
}

std::optional<domain::Catalog> CatalogStore::load(const fs::path& path) {
    if (!PersistenceService::exists(path)) {
        return std::nullopt;
    }

    std::string text = PersistenceService::readText(path);
    try {
        return fromJson(json::parse(text));
    } catch (const json::exception& e) {
        throw domain::FormatError("Cannot parse catalog " + path.string() + ": " + e.what());
    }
}

CatalogStore::SaveResult CatalogStore::save(const domain::Catalog& catalog, const fs::path& path, bool makeBackup) {
    SaveResult result;
    result.writtenPath = path;

    if (makeBackup && PersistenceService::exists(path)) {
        fs::path folder = backupFolderFor(path);
        std::error_code ec;
        fs::create_directories(folder, ec);
        if (ec) {
            throw domain::IOError("Cannot create backup folder " + folder.string() + ": " + ec.message());
        }

        fs::path backup = PersistenceService::uniqueBackupPath(
            folder, path.stem().string(), domain::FormatBackupStamp(std::chrono::system_clock::now()),
            path.extension().string());
        fs::copy_file(path, backup, fs::copy_options::none, ec);
        if (ec) {
            throw domain::IOError("Backup of " + path.string() + " failed: " + ec.message());
        }
        result.backupPath = backup;
        Log::Info("CatalogStore", "Backed up previous catalog to " + backup.string());
    }

    json j = toJson(catalog);
    PersistenceService::writeTextAtomic(path, j.dump(2, ' ', false, json::error_handler_t::replace) + "\n");

    result.stats = domain::ComputeStats(catalog);
    Log::Info("CatalogStore", "Saved " + std::to_string(result.stats.sizeGroups) + " size groups to " + path.string());
    return result;
}

} // namespace pdfcatalog::infrastructure
