// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace pdfcatalog::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetHomeDir();
    static std::filesystem::path GetConfigHome();
    /** @brief <config home>/pdfcatalog/settings.json */
    static std::filesystem::path GetDefaultSettingsPath();
};

} // namespace pdfcatalog::infrastructure
