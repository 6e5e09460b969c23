#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace pdfcatalog::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetHomeDir() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home);
    }
    return fs::current_path(); // Fallback
}

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    return GetHomeDir() / ".config";
}

fs::path PathUtils::GetDefaultSettingsPath() {
    return GetConfigHome() / "pdfcatalog" / "settings.json";
}

} // namespace pdfcatalog::infrastructure
