/**
 * @file CatalogSession.hpp
 * @brief Session context tying scanning, diffing, classification and renames together.
 */

#pragma once
#include <filesystem>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "application/ClassificationService.hpp"
#include "application/ScanCoordinator.hpp"
#include "domain/BarePdfIndex.hpp"
#include "domain/Catalog.hpp"
#include "domain/DuplicateAnalyzer.hpp"
#include "domain/FileRecord.hpp"
#include "domain/SnapshotDiffer.hpp"
#include "infrastructure/CatalogStore.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/FilesystemScanner.hpp"

namespace pdfcatalog::application {

/**
 * @class CatalogSession
 * @brief Explicit, independently constructible replacement for a process-wide
 * manager. Holds the scan results, the classification list and the bare-file
 * row index of one working session.
 *
 * Renames and catalog refreshes are serialized by one session mutex, so a
 * rename never interleaves with a scan or another rename.
 */
class CatalogSession {
public:
    /**
     * @struct RefreshOutcome
     * @brief Result of scanning the library and comparing with the saved catalog.
     */
    struct RefreshOutcome {
        domain::DiffResult diff;
        domain::Catalog catalog;
        size_t totalFiles = 0;
        size_t duplicateFiles = 0;  ///< Files sharing their size with another file.
        std::optional<infrastructure::CatalogStore::SaveResult> saved;  ///< Set only when changes were written.
    };

    /**
     * @struct PatternReport
     * @brief Rows of the prefixed-file scan and where the report was written.
     */
    struct PatternReport {
        std::vector<domain::PatternedFile> rows;  ///< Sorted by (pattern, filename).
        std::filesystem::path reportPath;
    };

    explicit CatalogSession(infrastructure::AppConfig config);

    const infrastructure::AppConfig& config() const { return m_config; }

    /**
     * @brief Raw scan of the library root.
     * @throws domain::ConflictError while a background scan is running.
     */
    std::vector<domain::FileRecord> scanRecords();

    /**
     * @brief Scans, diffs against the saved catalog and saves (with backup)
     * only when something changed.
     * @throws domain::ConflictError while a background scan is running.
     */
    RefreshOutcome refreshCatalog();

    /** @brief refreshCatalog on the scan worker; nullopt if a scan is already running. */
    std::optional<std::future<RefreshOutcome>> refreshCatalogAsync();

    /**
     * @brief Patterned-only scan written as a fixed-width report into reportDir.
     * @throws domain::ConflictError while a background scan is running.
     */
    PatternReport writePatternReport();

    /** @brief writePatternReport on the scan worker; nullopt if a scan is already running. */
    std::optional<std::future<PatternReport>> writePatternReportAsync();

    /** @brief Replaces the PDF title reader used by the pattern report. */
    void setTitleReader(infrastructure::FilesystemScanner::TitleReader reader);

    /** @brief Saved catalog, or NotFoundError if none has been written yet. */
    domain::Catalog loadSavedCatalog() const;

    /** @brief Protected-folder duplicate analysis over the saved catalog. */
    domain::DuplicateAnalysis analyzeDuplicates() const;
    domain::DuplicateAnalyzer makeAnalyzer() const;

    ClassificationService& classification() { return m_classification; }

    /** @brief Rebuilds the bare-file index for folder and returns it. */
    const domain::BarePdfIndex& listBareFiles(const std::filesystem::path& folder);

    /** @brief Current index; invalid after a rename until rebuilt. */
    const domain::BarePdfIndex& bareIndex() const { return m_bareIndex; }

    /**
     * @brief Prefixes the file shown at displayIndex with a known classification code.
     * @return The new filename.
     * @throws domain::StaleIndexError if the index was invalidated.
     * @throws domain::ValidationError for an unknown row or code.
     */
    std::string applyPrefixToRow(int displayIndex, const std::string& code);

    /** @brief Renames the file shown at displayIndex to newFilename. */
    void renameRow(int displayIndex, const std::string& newFilename);

    /** @brief Waits for a running background scan. */
    void waitForScan() { m_scans.wait(); }

private:
    void requireNoScanInFlight(const std::string& request) const;
    RefreshOutcome runRefresh();
    PatternReport runPatternReport();
    std::string rowFilename(int displayIndex) const;
    void afterRename();

    infrastructure::AppConfig m_config;
    infrastructure::FilesystemScanner m_scanner;
    ClassificationService m_classification;
    domain::BarePdfIndex m_bareIndex;
    std::mutex m_mutex;
    ScanCoordinator m_scans;  // Declared last: joins the worker before the members it uses go away.
};

} // namespace pdfcatalog::application
