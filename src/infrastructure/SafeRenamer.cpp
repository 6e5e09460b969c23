/**
 * @file SafeRenamer.cpp
 * @brief Implementation of SafeRenamer.
 */

#include "infrastructure/SafeRenamer.hpp"
#include "domain/Errors.hpp"
#include "domain/PrefixCodec.hpp"
#include "infrastructure/Log.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace pdfcatalog::infrastructure {

namespace fs = std::filesystem;

namespace {

// glibc >= 2.28 declares renameat2 in <stdio.h> under _GNU_SOURCE.
#if defined(__linux__) && defined(RENAME_NOREPLACE)
int RenameNoReplace(const char* from, const char* to) {
    return ::renameat2(AT_FDCWD, from, AT_FDCWD, to, RENAME_NOREPLACE);
}
#else
int RenameNoReplace(const char*, const char*) {
    errno = ENOSYS;
    return -1;
}
#endif

} // namespace

bool SafeRenamer::isPlainFilename(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    return name.find('/') == std::string::npos && name.find('\0') == std::string::npos;
}

void SafeRenamer::exclusiveRename(const fs::path& from, const fs::path& to) {
    if (RenameNoReplace(from.c_str(), to.c_str()) == 0) {
        return;
    }

    int err = errno;
    if (err == EINVAL || err == ENOSYS) {
        // Filesystem without RENAME_NOREPLACE: link() refuses an existing target too.
        if (::link(from.c_str(), to.c_str()) == 0) {
            if (::unlink(from.c_str()) != 0) {
                int unlinkErr = errno;
                ::unlink(to.c_str());
                throw domain::IOError("Rename of " + from.string() + " failed: " + std::strerror(unlinkErr));
            }
            return;
        }
        err = errno;
    }

    if (err == EEXIST) {
        throw domain::ConflictError("A file named '" + to.filename().string() + "' already exists.");
    }
    if (err == ENOENT) {
        throw domain::NotFoundError("File '" + from.filename().string() + "' not found on disk.");
    }
    throw domain::IOError("Rename of " + from.string() + " to " + to.string() + " failed: " + std::strerror(err));
}

void SafeRenamer::renameTo(const fs::path& folder, const std::string& currentFilename, const std::string& newFilename) {
    if (!isPlainFilename(currentFilename)) {
        throw domain::ValidationError("Invalid source filename: '" + currentFilename + "'");
    }
    if (!isPlainFilename(newFilename)) {
        throw domain::ValidationError("Filename cannot be empty or contain '/': '" + newFilename + "'");
    }

    const fs::path oldPath = folder / currentFilename;
    const fs::path newPath = folder / newFilename;

    std::error_code ec;
    if (!fs::exists(fs::symlink_status(oldPath, ec))) {
        throw domain::NotFoundError("File '" + currentFilename + "' not found on disk.");
    }
    if (currentFilename == newFilename) {
        return;
    }
    if (fs::exists(fs::symlink_status(newPath, ec))) {
        throw domain::ConflictError("A file named '" + newFilename + "' already exists.");
    }

    exclusiveRename(oldPath, newPath);
    Log::Info("SafeRenamer", "Renamed: " + currentFilename + " -> " + newFilename);
}

std::string SafeRenamer::applyPrefix(const fs::path& folder, const std::string& currentFilename, const std::string& code) {
    if (!domain::PrefixCodec::isValidCode(code)) {
        throw domain::ValidationError("ToK code must be alphanumeric only: '" + code + "'");
    }
    if (code.size() < domain::PrefixCodec::kMinPairs) {
        Log::Warn("SafeRenamer", "Code '" + code + "' is shorter than a recognizable prefix; "
                  "the renamed file will still list as bare");
    }

    std::string newFilename = domain::PrefixCodec::applyTo(code, currentFilename);
    renameTo(folder, currentFilename, newFilename);
    return newFilename;
}

} // namespace pdfcatalog::infrastructure
