/**
 * @file ReportWriter.hpp
 * @brief Plain-text reports: the prefixed-file table and the duplicate analysis.
 */

#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include "domain/DuplicateAnalyzer.hpp"
#include "domain/FileRecord.hpp"

namespace pdfcatalog::infrastructure {

class ReportWriter {
public:
    /**
     * @brief Fixed-width table with columns Pattern, Filename, Folder, Internal Title.
     * Each width is the longest value + 2 (minimums 10/20/20). Rows must already
     * be sorted by (pattern, filename).
     */
    static std::string formatPatternReport(const std::vector<domain::PatternedFile>& rows);

    /** @brief Console summary with the top five folders and up to five examples each. */
    static std::string formatDuplicateSummary(const domain::DuplicateAnalysis& analysis,
                                              const domain::DuplicateAnalyzer& analyzer);

    /** @brief Every deletable file per folder, with sizes and protected copies. */
    static std::string formatDuplicateDetails(const domain::DuplicateAnalysis& analysis,
                                              const domain::DuplicateAnalyzer& analyzer);

    /** @brief Atomically writes a report. Throws domain::IOError. */
    static void write(const std::filesystem::path& path, const std::string& text);

    /** @brief Sorts patterned rows by (pattern, filename). */
    static void sortRows(std::vector<domain::PatternedFile>& rows);
};

} // namespace pdfcatalog::infrastructure
