/**
 * @file DuplicateAnalyzer.hpp
 * @brief Finds copies outside protected folders of files kept in protected ones.
 */

#pragma once
#include <map>
#include <string>
#include <vector>
#include "domain/Catalog.hpp"

namespace pdfcatalog::domain {

/**
 * @struct DeletableFile
 * @brief A copy in an unprotected folder of a file that also lives in a protected folder.
 */
struct DeletableFile {
    std::string filename;
    long long sizeBytes = 0;
    std::vector<std::string> protectedLocations;
};

/**
 * @struct DuplicateAnalysis
 * @brief Result of DuplicateAnalyzer::analyze.
 */
struct DuplicateAnalysis {
    size_t filesInProtected = 0;     ///< Base filenames present in a protected folder and elsewhere.
    size_t deletableDuplicates = 0;  ///< Unprotected locations of those files.
    std::map<std::string, std::vector<DeletableFile>> deletableByFolder;

    /** @brief Folders ordered by deletable count descending, then by name. */
    std::vector<std::pair<std::string, const std::vector<DeletableFile>*>> sortedFolders() const;
};

class DuplicateAnalyzer {
public:
    DuplicateAnalyzer(std::vector<std::string> protectedFolders, std::vector<std::string> ignoredFolders);

    DuplicateAnalysis analyze(const Catalog& catalog) const;

    bool isProtected(const std::string& folder) const;
    bool isIgnored(const std::string& folder) const;

    const std::vector<std::string>& protectedFolders() const { return m_protected; }
    const std::vector<std::string>& ignoredFolders() const { return m_ignored; }

private:
    std::vector<std::string> m_protected;
    std::vector<std::string> m_ignored;
};

} // namespace pdfcatalog::domain
