/**
 * @file SafeRenamer.hpp
 * @brief Renames library files without ever replacing an existing file.
 */

#pragma once
#include <filesystem>
#include <string>

namespace pdfcatalog::infrastructure {

/**
 * @class SafeRenamer
 * @brief Applies classification prefixes and plain renames inside one folder.
 *
 * Preconditions are checked before the filesystem is touched: the source must
 * exist (NotFoundError) and the destination must not (ConflictError). The
 * rename itself is exclusive (renameat2 RENAME_NOREPLACE, or link+unlink where
 * the filesystem lacks it), so a destination created between the check and
 * the rename is still never overwritten.
 */
class SafeRenamer {
public:
    /**
     * @brief Prepends the formatted code to the filename.
     * @return The new filename.
     * @throws domain::ValidationError for an invalid code or filename.
     */
    static std::string applyPrefix(const std::filesystem::path& folder,
                                   const std::string& currentFilename,
                                   const std::string& code);

    /**
     * @brief Renames folder/currentFilename to folder/newFilename.
     * Renaming a file to its own name is a no-op.
     */
    static void renameTo(const std::filesystem::path& folder,
                         const std::string& currentFilename,
                         const std::string& newFilename);

    /** @brief Non-empty, not "." or "..", and free of path separators and NUL. */
    static bool isPlainFilename(const std::string& name);

private:
    static void exclusiveRename(const std::filesystem::path& from, const std::filesystem::path& to);
};

} // namespace pdfcatalog::infrastructure
