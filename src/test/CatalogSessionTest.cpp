#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <thread>
#include "application/CatalogSession.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/CatalogStore.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace fs = std::filesystem;
using namespace pdfcatalog;
using application::CatalogSession;

static void Touch(const fs::path& path, size_t size) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << std::string(size, 'x');
}

template <typename E, typename F>
static bool Throws(F&& f) {
    try {
        f();
    } catch (const E&) {
        return true;
    }
    return false;
}

static infrastructure::AppConfig MakeConfig(const fs::path& root) {
    infrastructure::AppConfig config;
    config.libraryRoot = root / "library";
    config.catalogPath = root / "state" / "pdf-files-by-size.json";
    config.tokPath = root / "state" / "tok.json";
    config.reportDir = root / "reports";
    infrastructure::ConfigLoader::ResolveDefaults(config);
    return config;
}

static void TestRefresh(const fs::path& root) {
    std::cout << "[Test] Duplicate scenario end to end..." << std::endl;
    fs::path library = root / "library";
    Touch(library / "folder1" / "A B report.pdf", 100);
    Touch(library / "folder2" / "report.pdf", 100);
    Touch(library / "folder2" / "unique.pdf", 7);

    CatalogSession session(MakeConfig(root));
    CatalogSession::RefreshOutcome first = session.refreshCatalog();
    assert(first.totalFiles == 3);
    assert(first.duplicateFiles == 2);
    assert(first.diff.hasChanges);
    assert(first.diff.count(domain::DiffKind::Info) == 1);
    assert(first.saved);
    assert(!first.saved->backupPath);

    assert(first.catalog.size() == 1);
    const domain::SizeGroup& group = first.catalog[0];
    assert(group.sizeBytes == 100);
    assert(group.files.size() == 1);
    assert(group.files[0].filename == "report.pdf");
    assert(group.files[0].codesString() == "AB");
    assert(group.files[0].locations.size() == 2);
    assert(group.files[0].locations[0].folder == "folder1");
    assert(group.files[0].locations[1].folder == "folder2");

    auto saved = infrastructure::CatalogStore::load(root / "state" / "pdf-files-by-size.json");
    assert(saved && saved->at(0).files[0].codesString() == "AB");
    std::cout << "[PASS] Duplicate scenario" << std::endl;

    std::cout << "[Test] Unchanged library is not rewritten..." << std::endl;
    std::string before = infrastructure::PersistenceService::readText(root / "state" / "pdf-files-by-size.json");
    CatalogSession::RefreshOutcome second = session.refreshCatalog();
    assert(!second.diff.hasChanges);
    assert(!second.saved);
    assert(!fs::exists(root / "state" / "pdf-files-by-size-old-files"));
    assert(infrastructure::PersistenceService::readText(root / "state" / "pdf-files-by-size.json") == before);
    std::cout << "[PASS] Unchanged library" << std::endl;

    std::cout << "[Test] New copy is reported and backed up..." << std::endl;
    Touch(library / "folder3" / "report.pdf", 100);
    auto pending = session.refreshCatalogAsync();
    assert(pending);
    CatalogSession::RefreshOutcome third = pending->get();
    assert(third.diff.entries.size() == 1);
    assert(third.diff.entries[0].kind == domain::DiffKind::MovedTo);
    assert(third.diff.entries[0].folder == "folder3");
    assert(third.saved && third.saved->backupPath);
    assert(infrastructure::PersistenceService::readText(*third.saved->backupPath) == before);
    session.waitForScan();
    std::cout << "[PASS] New copy" << std::endl;

    std::cout << "[Test] Duplicate analysis over the saved catalog..." << std::endl;
    domain::DuplicateAnalysis analysis = session.analyzeDuplicates();
    assert(analysis.filesInProtected == 0);
    std::cout << "[PASS] Duplicate analysis" << std::endl;
}

static void TestPatternReport(const fs::path& root) {
    std::cout << "[Test] Pattern report..." << std::endl;
    CatalogSession session(MakeConfig(root));
    CatalogSession::PatternReport report = session.writePatternReport();
    assert(report.rows.size() == 1);
    assert(report.rows[0].prefix == "A B");
    assert(report.rows[0].folder == "folder1");
    assert(report.reportPath == root / "reports" / "pdf-document.txt");
    std::string text = infrastructure::PersistenceService::readText(report.reportPath);
    assert(text.find("Pattern") == 0);
    assert(text.find("report.pdf") != std::string::npos);
    std::cout << "[PASS] Pattern report" << std::endl;
}

static void TestOverlappingScans(const fs::path& root) {
    std::cout << "[Test] Only one traversal of the library at a time..." << std::endl;
    CatalogSession session(MakeConfig(root));

    std::atomic<bool> entered{false};
    std::atomic<bool> release{false};
    session.setTitleReader([&](const std::string&) {
        entered = true;
        while (!release) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return std::string("Held");
    });

    auto report = session.writePatternReportAsync();
    assert(report);
    while (!entered) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    assert(!session.refreshCatalogAsync());
    assert(!session.writePatternReportAsync());
    assert(Throws<domain::ConflictError>([&] { session.writePatternReport(); }));
    assert(Throws<domain::ConflictError>([&] { session.refreshCatalog(); }));
    assert(Throws<domain::ConflictError>([&] { session.scanRecords(); }));

    release = true;
    CatalogSession::PatternReport held = report->get();
    assert(held.rows.size() == 1);
    assert(held.rows[0].internalTitle == "Held");
    session.waitForScan();

    auto refresh = session.refreshCatalogAsync();
    assert(refresh);
    refresh->get();
    session.waitForScan();
    assert(session.scanRecords().size() == 4);
    std::cout << "[PASS] Overlapping scans" << std::endl;
}

static void TestBareIndex(const fs::path& root) {
    std::cout << "[Test] Bare index and row operations..." << std::endl;
    fs::path work = root / "work";
    Touch(work / "older.pdf", 1);
    Touch(work / "newer.pdf", 1);
    auto now = fs::file_time_type::clock::now();
    fs::last_write_time(work / "older.pdf", now - std::chrono::hours(2));
    fs::last_write_time(work / "newer.pdf", now - std::chrono::hours(1));

    CatalogSession session(MakeConfig(root));
    session.classification().add("A", "Articles");
    session.classification().add("AB", "Articles about B");

    // No listing yet.
    assert(Throws<domain::StaleIndexError>([&] { session.applyPrefixToRow(1, "AB"); }));

    const domain::BarePdfIndex& index = session.listBareFiles(work);
    assert(index.size() == 2);
    assert(*index.filenameAt(1) == "newer.pdf");

    assert(Throws<domain::ValidationError>([&] { session.applyPrefixToRow(1, "ZZ"); }));
    assert(Throws<domain::ValidationError>([&] { session.applyPrefixToRow(5, "AB"); }));
    assert(fs::exists(work / "newer.pdf"));

    std::string renamed = session.applyPrefixToRow(1, "AB");
    assert(renamed == "A B newer.pdf");
    assert(fs::exists(work / "A B newer.pdf"));
    assert(session.bareIndex().isValid());
    assert(session.bareIndex().size() == 1);
    assert(*session.bareIndex().filenameAt(1) == "older.pdf");
    std::cout << "[PASS] Bare index" << std::endl;

    std::cout << "[Test] Rename conflict keeps the index..." << std::endl;
    Touch(work / "taken.txt", 1);
    assert(Throws<domain::ConflictError>([&] { session.renameRow(1, "taken.txt"); }));
    assert(fs::exists(work / "older.pdf"));
    assert(session.bareIndex().isValid());
    assert(*session.bareIndex().filenameAt(1) == "older.pdf");

    session.renameRow(1, "oldest.pdf");
    assert(fs::exists(work / "oldest.pdf"));
    assert(*session.bareIndex().filenameAt(1) == "oldest.pdf");
    std::cout << "[PASS] Rename" << std::endl;
}

int main() {
    fs::path root = fs::temp_directory_path() / "pdfcatalog_session_test";
    fs::remove_all(root);
    fs::create_directories(root);

    TestRefresh(root);
    TestPatternReport(root);
    TestOverlappingScans(root);
    TestBareIndex(root);

    fs::remove_all(root);
    std::cout << "[PASS] CatalogSessionTest" << std::endl;
    return 0;
}
