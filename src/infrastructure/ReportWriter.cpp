/**
 * @file ReportWriter.cpp
 * @brief Implementation of ReportWriter.
 */

#include "infrastructure/ReportWriter.hpp"
#include "domain/SnapshotDiffer.hpp"
#include "infrastructure/PersistenceService.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace pdfcatalog::infrastructure {

namespace {

const std::string kRule(80, '=');
const std::string kThinRule(80, '-');

void WriteFolderLists(std::ostringstream& out, const domain::DuplicateAnalyzer& analyzer) {
    out << "Protected folders (DO NOT DELETE from these):\n";
    for (const auto& folder : analyzer.protectedFolders()) {
        out << "  - " << folder << "\n";
    }
    out << "\nIgnored folders (not included in analysis):\n";
    for (const auto& folder : analyzer.ignoredFolders()) {
        out << "  - " << folder << "\n";
    }
}

} // namespace

void ReportWriter::sortRows(std::vector<domain::PatternedFile>& rows) {
    std::stable_sort(rows.begin(), rows.end(), [](const domain::PatternedFile& a, const domain::PatternedFile& b) {
        if (a.prefix != b.prefix) return a.prefix < b.prefix;
        return a.baseFilename < b.baseFilename;
    });
}

std::string ReportWriter::formatPatternReport(const std::vector<domain::PatternedFile>& rows) {
    size_t w1 = 10;
    size_t w2 = 20;
    size_t w3 = 20;
    for (const auto& row : rows) {
        w1 = std::max(w1, row.prefix.size() + 2);
        w2 = std::max(w2, row.baseFilename.size() + 2);
        w3 = std::max(w3, row.folder.size() + 2);
    }

    std::ostringstream out;
    out << std::left
        << std::setw(static_cast<int>(w1)) << "Pattern" << " "
        << std::setw(static_cast<int>(w2)) << "Filename" << " "
        << std::setw(static_cast<int>(w3)) << "Folder" << " "
        << "Internal Title\n";
    out << std::string(w1 + w2 + w3 + 50, '-') << "\n";

    for (const auto& row : rows) {
        out << std::setw(static_cast<int>(w1)) << row.prefix << " "
            << std::setw(static_cast<int>(w2)) << row.baseFilename << " "
            << std::setw(static_cast<int>(w3)) << row.folder << " "
            << row.internalTitle << "\n";
    }
    return out.str();
}

std::string ReportWriter::formatDuplicateSummary(const domain::DuplicateAnalysis& analysis,
                                                 const domain::DuplicateAnalyzer& analyzer) {
    std::ostringstream out;
    out << "\n" << kRule << "\nDUPLICATE PDF ANALYSIS REPORT\n" << kRule << "\n\n";
    WriteFolderLists(out, analyzer);
    out << "\n" << kThinRule << "\n";
    out << "Files that exist in protected folders: " << analysis.filesInProtected << "\n";
    out << "Total deletable duplicates in other folders: " << analysis.deletableDuplicates << "\n";
    out << kThinRule << "\n\n";

    auto folders = analysis.sortedFolders();
    out << "Folders with deletable duplicates (sorted by count):\n\n";
    out << std::left << std::setw(8) << "Count" << " Folder\n" << kThinRule << "\n";
    for (const auto& [folder, files] : folders) {
        out << std::setw(8) << files->size() << " " << folder << "\n";
    }
    out << "\n" << kRule << "\n";

    out << "\nTOP 5 FOLDERS WITH MOST DELETABLE DUPLICATES:\n";
    size_t shown = 0;
    for (const auto& [folder, files] : folders) {
        if (shown++ == 5) break;
        out << "\n" << shown << ". " << folder << "\n";
        out << "   Deletable files: " << files->size() << "\n";
        out << "   Examples:\n";
        for (size_t i = 0; i < files->size() && i < 5; ++i) {
            const auto& file = (*files)[i];
            out << "     - " << file.filename << "\n";
            out << "       (also in: " << file.protectedLocations.front() << ")\n";
        }
        if (files->size() > 5) {
            out << "     ... and " << (files->size() - 5) << " more\n";
        }
    }
    out << "\n" << kRule << "\n";
    return out.str();
}

std::string ReportWriter::formatDuplicateDetails(const domain::DuplicateAnalysis& analysis,
                                                 const domain::DuplicateAnalyzer& analyzer) {
    std::ostringstream out;
    out << "DETAILED DUPLICATE PDF ANALYSIS REPORT\n" << kRule << "\n\n";
    WriteFolderLists(out, analyzer);
    out << "\nTotal files in protected folders: " << analysis.filesInProtected << "\n";
    out << "Total deletable duplicates: " << analysis.deletableDuplicates << "\n\n";
    out << kRule << "\n\n";

    for (const auto& [folder, files] : analysis.sortedFolders()) {
        out << "\nFolder: " << folder << "\n";
        out << "Deletable files: " << files->size() << "\n";
        out << kThinRule << "\n";
        for (const auto& file : *files) {
            out << "  " << file.filename << "\n";
            out << "    Size: " << domain::SnapshotDiffer::formatBytes(file.sizeBytes) << " bytes\n";
            out << "    Also in protected folder(s): ";
            for (size_t i = 0; i < file.protectedLocations.size(); ++i) {
                if (i) out << ", ";
                out << file.protectedLocations[i];
            }
            out << "\n";
        }
        out << "\n";
    }
    return out.str();
}

void ReportWriter::write(const std::filesystem::path& path, const std::string& text) {
    PersistenceService::writeTextAtomic(path, text);
}

} // namespace pdfcatalog::infrastructure
