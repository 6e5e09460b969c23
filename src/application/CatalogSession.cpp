/**
 * @file CatalogSession.cpp
 * @brief Implementation of CatalogSession.
 */

#include "application/CatalogSession.hpp"
#include "domain/Errors.hpp"
#include "domain/SizeIndex.hpp"
#include "infrastructure/Log.hpp"
#include "infrastructure/ReportWriter.hpp"
#include "infrastructure/SafeRenamer.hpp"

namespace pdfcatalog::application {

using infrastructure::Log;

CatalogSession::CatalogSession(infrastructure::AppConfig config)
    : m_config(std::move(config)),
      m_scanner(m_config.libraryRoot, std::set<std::string>(m_config.excludeDirs.begin(), m_config.excludeDirs.end())),
      m_classification(infrastructure::ClassificationStore(m_config.tokPath)) {}

// Synchronous entry points refuse to start a second traversal of the root;
// every traversal also holds m_mutex so it never overlaps a rename.
void CatalogSession::requireNoScanInFlight(const std::string& request) const {
    if (m_scans.isBusy()) {
        throw domain::ConflictError("Cannot start " + request + ": a library scan is already running.");
    }
}

void CatalogSession::setTitleReader(infrastructure::FilesystemScanner::TitleReader reader) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_scanner.setTitleReader(std::move(reader));
}

std::vector<domain::FileRecord> CatalogSession::scanRecords() {
    requireNoScanInFlight("scan");
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_scanner.scan();
}

CatalogSession::RefreshOutcome CatalogSession::refreshCatalog() {
    requireNoScanInFlight("catalog refresh");
    return runRefresh();
}

CatalogSession::RefreshOutcome CatalogSession::runRefresh() {
    std::lock_guard<std::mutex> lock(m_mutex);
    RefreshOutcome outcome;

    Log::Info("CatalogSession", "Scanning all PDFs under " + m_config.libraryRoot.string());
    std::vector<domain::FileRecord> records = m_scanner.scan();
    domain::SizeIndexMap index = domain::SizeIndex::buildIndex(records);

    outcome.totalFiles = records.size();
    outcome.duplicateFiles = domain::SizeIndex::countDuplicateRecords(index);
    outcome.catalog = domain::SizeIndex::toCatalog(index, m_config.duplicatesOnly);

    std::optional<domain::Catalog> previous = infrastructure::CatalogStore::load(m_config.catalogPath);
    outcome.diff = domain::SnapshotDiffer::diff(previous, outcome.catalog);

    if (outcome.diff.hasChanges) {
        Log::Info("CatalogSession", "Found " + std::to_string(outcome.diff.entries.size()) + " difference(s)");
        outcome.saved = infrastructure::CatalogStore::save(outcome.catalog, m_config.catalogPath, true);
    } else {
        Log::Info("CatalogSession", "No differences detected; catalog not rewritten");
    }
    return outcome;
}

std::optional<std::future<CatalogSession::RefreshOutcome>> CatalogSession::refreshCatalogAsync() {
    return m_scans.trySubmit("catalog refresh", [this]() { return runRefresh(); });
}

CatalogSession::PatternReport CatalogSession::writePatternReport() {
    requireNoScanInFlight("pattern report");
    return runPatternReport();
}

std::optional<std::future<CatalogSession::PatternReport>> CatalogSession::writePatternReportAsync() {
    return m_scans.trySubmit("pattern report", [this]() { return runPatternReport(); });
}

CatalogSession::PatternReport CatalogSession::runPatternReport() {
    std::lock_guard<std::mutex> lock(m_mutex);
    PatternReport report;
    report.rows = m_scanner.scanPatternedOnly();
    infrastructure::ReportWriter::sortRows(report.rows);

    report.reportPath = m_config.reportDir / "pdf-document.txt";
    infrastructure::ReportWriter::write(report.reportPath, infrastructure::ReportWriter::formatPatternReport(report.rows));
    Log::Info("CatalogSession", "Report written to " + report.reportPath.string());
    return report;
}

domain::Catalog CatalogSession::loadSavedCatalog() const {
    std::optional<domain::Catalog> saved = infrastructure::CatalogStore::load(m_config.catalogPath);
    if (!saved) {
        throw domain::NotFoundError("No saved catalog at " + m_config.catalogPath.string() + "; run a scan first.");
    }
    return *saved;
}

domain::DuplicateAnalyzer CatalogSession::makeAnalyzer() const {
    return domain::DuplicateAnalyzer(m_config.protectedFolders, m_config.ignoredFolders);
}

domain::DuplicateAnalysis CatalogSession::analyzeDuplicates() const {
    return makeAnalyzer().analyze(loadSavedCatalog());
}

const domain::BarePdfIndex& CatalogSession::listBareFiles(const std::filesystem::path& folder) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_bareIndex = infrastructure::FilesystemScanner::listBareFiles(folder);
    return m_bareIndex;
}

std::string CatalogSession::rowFilename(int displayIndex) const {
    if (!m_bareIndex.isValid()) {
        throw domain::StaleIndexError("File list is out of date; reload the bare PDF list.");
    }
    auto filename = m_bareIndex.filenameAt(displayIndex);
    if (!filename) {
        throw domain::ValidationError("No file at row " + std::to_string(displayIndex) + ".");
    }
    return *filename;
}

void CatalogSession::afterRename() {
    std::string folder = m_bareIndex.folder();
    m_bareIndex.invalidate();
    try {
        m_bareIndex = infrastructure::FilesystemScanner::listBareFiles(folder);
    } catch (const domain::CatalogError& e) {
        Log::Error("CatalogSession", std::string("Could not reload bare PDF list: ") + e.what());
    }
}

std::string CatalogSession::applyPrefixToRow(int displayIndex, const std::string& code) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const std::string filename = rowFilename(displayIndex);

    const std::string cleanCode = ClassificationService::trim(code);
    if (!m_classification.tree().contains(cleanCode)) {
        throw domain::ValidationError("Unknown ToK code '" + cleanCode + "'.");
    }

    std::string newFilename = infrastructure::SafeRenamer::applyPrefix(m_bareIndex.folder(), filename, cleanCode);
    afterRename();
    return newFilename;
}

void CatalogSession::renameRow(int displayIndex, const std::string& newFilename) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const std::string filename = rowFilename(displayIndex);
    const std::string cleanName = ClassificationService::trim(newFilename);
    if (cleanName == filename) {
        return;
    }

    infrastructure::SafeRenamer::renameTo(m_bareIndex.folder(), filename, cleanName);
    afterRename();
}

} // namespace pdfcatalog::application
