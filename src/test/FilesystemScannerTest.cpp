#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include "domain/Errors.hpp"
#include "infrastructure/FilesystemScanner.hpp"

namespace fs = std::filesystem;
using namespace pdfcatalog;
using infrastructure::FilesystemScanner;

static void Touch(const fs::path& path, size_t size) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << std::string(size, 'x');
}

int main() {
    fs::path root = fs::temp_directory_path() / "pdfcatalog_scanner_test";
    fs::remove_all(root);

    Touch(root / "top.pdf", 10);
    Touch(root / "A B classified.PDF", 20);
    Touch(root / "notes.txt", 30);
    Touch(root / "sub" / "deep" / "inner.pdf", 40);
    Touch(root / "RAG" / "skipped.pdf", 50);

    std::cout << "[Test] Recursive scan with exclusions..." << std::endl;
    FilesystemScanner scanner(root, {"RAG"});
    auto records = scanner.scan();
    assert(records.size() == 3);

    bool sawRoot = false, sawDeep = false, sawClassified = false;
    for (const auto& r : records) {
        assert(r.baseFilename != "skipped.pdf");
        if (r.baseFilename == "top.pdf") {
            sawRoot = r.folder == domain::kRootFolderToken && r.sizeBytes == 10;
        } else if (r.baseFilename == "inner.pdf") {
            sawDeep = r.folder == "sub/deep" && r.sizeBytes == 40;
        } else if (r.baseFilename == "classified.PDF") {
            sawClassified = r.classificationCode == "AB";
        }
    }
    assert(sawRoot && sawDeep && sawClassified);
    std::cout << "[PASS] Recursive scan" << std::endl;

    std::cout << "[Test] Patterned scan reads titles..." << std::endl;
    scanner.setTitleReader([](const std::string& path) {
        return path.find("classified") != std::string::npos ? "A Title" : "";
    });
    auto patterned = scanner.scanPatternedOnly();
    assert(patterned.size() == 1);
    assert(patterned[0].prefix == "A B");
    assert(patterned[0].baseFilename == "classified.PDF");
    assert(patterned[0].internalTitle == "A Title");
    std::cout << "[PASS] Patterned scan" << std::endl;

    std::cout << "[Test] Bare listing, newest first..." << std::endl;
    fs::path work = root / "work";
    Touch(work / "old.pdf", 1);
    Touch(work / "new.pdf", 1);
    Touch(work / "X Y done.pdf", 1);
    auto now = fs::file_time_type::clock::now();
    fs::last_write_time(work / "old.pdf", now - std::chrono::hours(2));
    fs::last_write_time(work / "new.pdf", now - std::chrono::hours(1));
    auto index = FilesystemScanner::listBareFiles(work);
    assert(index.isValid());
    assert(index.size() == 2);
    assert(index.rows()[0].displayIndex == 1);
    assert(*index.filenameAt(1) == "new.pdf");
    assert(*index.filenameAt(2) == "old.pdf");
    assert(!index.filenameAt(0));
    assert(!index.filenameAt(3));
    std::cout << "[PASS] Bare listing" << std::endl;

    std::cout << "[Test] Missing root..." << std::endl;
    FilesystemScanner missing(root / "nope", {});
    bool threw = false;
    try {
        missing.scan();
    } catch (const domain::NotFoundError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Missing root" << std::endl;

    fs::remove_all(root);
    std::cout << "[PASS] FilesystemScannerTest" << std::endl;
    return 0;
}
