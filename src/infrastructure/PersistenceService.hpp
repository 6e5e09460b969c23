/**
 * @file PersistenceService.hpp
 * @brief Atomic file writes and backup copies for the catalog documents.
 */

#pragma once
#include <filesystem>
#include <string>

namespace pdfcatalog::infrastructure {

/**
 * @class PersistenceService
 * @brief Writes documents via a temp sibling and a rename so a reader never
 * sees a half-written file. All failures raise domain::IOError.
 */
class PersistenceService {
public:
    /**
     * @brief Writes content to path atomically (temp -> rename).
     * Parent directories are created when missing.
     */
    static void writeTextAtomic(const std::filesystem::path& path, const std::string& content);

    /**
     * @brief True if something exists at path.
     * @throws domain::IOError when the path cannot be examined (permissions, loops).
     */
    static bool exists(const std::filesystem::path& path);

    /** @brief Reads a whole file. Throws NotFoundError / IOError. */
    static std::string readText(const std::filesystem::path& path);

    /**
     * @brief Returns dir/stem_<stamp>.json, or with a _N counter if that name is
     * already taken, so two backups in the same second never collide.
     */
    static std::filesystem::path uniqueBackupPath(const std::filesystem::path& dir,
                                                  const std::string& stem,
                                                  const std::string& stamp,
                                                  const std::string& extension);
};

} // namespace pdfcatalog::infrastructure
