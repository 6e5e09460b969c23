/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/Log.hpp"
#include <chrono>
#include <fstream>
#include <sstream>

namespace pdfcatalog::infrastructure {

namespace fs = std::filesystem;

bool PersistenceService::exists(const fs::path& path) {
    std::error_code ec;
    bool found = fs::exists(path, ec);
    if (ec) {
        throw domain::IOError("Cannot access " + path.string() + ": " + ec.message());
    }
    return found;
}

void PersistenceService::writeTextAtomic(const fs::path& path, const std::string& content) {
    // Create unique temp path: filename.<timestamp>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = path;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    // 1. Ensure directory exists
    std::error_code ec;
    if (path.has_parent_path() && !exists(path.parent_path())) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw domain::IOError("Cannot create directory " + path.parent_path().string() + ": " + ec.message());
        }
    }

    // 2. Write to Temp
    {
        std::ofstream ofs(tempPath, std::ios::binary);
        if (!ofs.is_open()) {
            throw domain::IOError("Failed to open temp file: " + tempPath.string());
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            fs::remove(tempPath, ec);
            throw domain::IOError("Write failed: " + tempPath.string());
        }
    }

    // 3. Atomic Rename
    fs::rename(tempPath, path, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        throw domain::IOError("Rename of " + tempPath.string() + " to " + path.string() + " failed: " + ec.message());
    }
}

std::string PersistenceService::readText(const fs::path& path) {
    if (!exists(path)) {
        throw domain::NotFoundError("File not found: " + path.string());
    }
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw domain::IOError("Cannot open " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw domain::IOError("Read failed: " + path.string());
    }
    return buffer.str();
}

fs::path PersistenceService::uniqueBackupPath(const fs::path& dir, const std::string& stem,
                                              const std::string& stamp, const std::string& extension) {
    fs::path candidate = dir / (stem + "_" + stamp + extension);
    for (int counter = 1; exists(candidate); ++counter) {
        candidate = dir / (stem + "_" + stamp + "_" + std::to_string(counter) + extension);
    }
    return candidate;
}

} // namespace pdfcatalog::infrastructure
