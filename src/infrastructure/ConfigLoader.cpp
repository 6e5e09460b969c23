/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/Log.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/PersistenceService.hpp"
#include <fstream>
#include <nlohmann/json.hpp>

namespace pdfcatalog::infrastructure {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

void ReadPath(const json& j, const char* key, fs::path& target) {
    if (j.contains(key) && j[key].is_string()) {
        target = fs::path(j[key].get<std::string>());
    }
}

void ReadList(const json& j, const char* key, std::vector<std::string>& target) {
    if (j.contains(key) && j[key].is_array()) {
        target = j[key].get<std::vector<std::string>>();
    }
}

} // namespace

AppConfig ConfigLoader::Load(const std::optional<fs::path>& settingsPath) {
    AppConfig config;
    fs::path configPath = settingsPath ? *settingsPath : PathUtils::GetDefaultSettingsPath();

    std::error_code ec;
    bool found = fs::exists(configPath, ec);
    if (ec) {
        Log::Error("ConfigLoader", "Cannot access " + configPath.string() + ": " + ec.message() + " (using defaults)");
        return config;
    }

    if (found) {
        try {
            std::ifstream f(configPath);
            json j;
            f >> j;

            ReadPath(j, "library_root", config.libraryRoot);
            ReadList(j, "exclude_dirs", config.excludeDirs);
            ReadPath(j, "catalog_path", config.catalogPath);
            ReadPath(j, "tok_path", config.tokPath);
            ReadPath(j, "report_dir", config.reportDir);
            if (j.contains("duplicates_only") && j["duplicates_only"].is_boolean()) {
                config.duplicatesOnly = j["duplicates_only"].get<bool>();
            }
            ReadList(j, "protected_folders", config.protectedFolders);
            ReadList(j, "ignored_folders", config.ignoredFolders);
        } catch (const std::exception& e) {
            Log::Error("ConfigLoader", "Error reading " + configPath.string() + ": " + e.what() + " (using defaults)");
            config = AppConfig{};
        }
    } else if (settingsPath) {
        Log::Warn("ConfigLoader", "Settings file not found: " + configPath.string() + " (using defaults)");
    }

    return config;
}

void ConfigLoader::ResolveDefaults(AppConfig& config) {
    if (config.libraryRoot.empty()) {
        config.libraryRoot = PathUtils::GetHomeDir() / "Dropbox";
    }
    if (config.catalogPath.empty()) {
        config.catalogPath = config.libraryRoot / "pdfmanager" / "pdf-files-by-size.json";
    }
    if (config.tokPath.empty()) {
        config.tokPath = config.libraryRoot / "pdfmanager" / "pdf_manager_tok_init.json";
    }
    if (config.reportDir.empty()) {
        config.reportDir = config.libraryRoot / "coffeetable";
    }
}

bool ConfigLoader::SaveDefaults(const fs::path& settingsPath, const AppConfig& config) {
    if (PersistenceService::exists(settingsPath)) {
        return false;
    }

    json j;
    j["library_root"] = config.libraryRoot.string();
    j["exclude_dirs"] = config.excludeDirs;
    j["catalog_path"] = config.catalogPath.string();
    j["tok_path"] = config.tokPath.string();
    j["report_dir"] = config.reportDir.string();
    j["duplicates_only"] = config.duplicatesOnly;
    j["protected_folders"] = config.protectedFolders;
    j["ignored_folders"] = config.ignoredFolders;

    PersistenceService::writeTextAtomic(settingsPath, j.dump(4) + "\n");
    return true;
}

} // namespace pdfcatalog::infrastructure
