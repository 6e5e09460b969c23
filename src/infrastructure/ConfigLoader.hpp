/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving application configuration (settings.json).
 *
 * Provides a unified way to access library paths and folder lists without
 * scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace pdfcatalog::infrastructure {

/**
 * @struct AppConfig
 * @brief Resolved settings. Paths left empty in settings.json are derived
 * from libraryRoot by ConfigLoader::ResolveDefaults.
 */
struct AppConfig {
    std::filesystem::path libraryRoot;
    std::vector<std::string> excludeDirs{"RAG"};
    std::filesystem::path catalogPath;
    std::filesystem::path tokPath;
    std::filesystem::path reportDir;
    bool duplicatesOnly = true;
    std::vector<std::string> protectedFolders{"documents", "1hugefiles", "documents-in-folders", "1-spark-library"};
    std::vector<std::string> ignoredFolders{"pdfmanager"};
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json; missing keys keep their defaults.
     * @param settingsPath Explicit file, or nullopt for the XDG default location.
     * A missing file yields defaults. A malformed file is reported and ignored.
     * Derived paths are left empty; call ResolveDefaults after any overrides.
     */
    static AppConfig Load(const std::optional<std::filesystem::path>& settingsPath = std::nullopt);

    /** @brief Fills empty paths from libraryRoot (defaulting to ~/Dropbox). */
    static void ResolveDefaults(AppConfig& config);

    /**
     * @brief Writes the given config to settingsPath unless a file already exists there.
     * @return True if a file was written.
     */
    static bool SaveDefaults(const std::filesystem::path& settingsPath, const AppConfig& config);
};

} // namespace pdfcatalog::infrastructure
