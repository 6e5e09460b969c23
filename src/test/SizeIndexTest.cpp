#include <cassert>
#include <chrono>
#include <iostream>
#include "domain/SizeIndex.hpp"

using namespace pdfcatalog::domain;

static FileRecord Record(const std::string& name, const std::string& code, const std::string& folder, long long size) {
    FileRecord r;
    r.baseFilename = name;
    r.classificationCode = code;
    r.folder = folder;
    r.sizeBytes = size;
    r.createdAt = std::chrono::system_clock::from_time_t(1700000000);
    r.modifiedAt = std::chrono::system_clock::from_time_t(1700000500);
    return r;
}

int main() {
    std::vector<FileRecord> records = {
        Record("report.pdf", "AB", "folder1", 100),
        Record("single.pdf", "", "[root]", 50),
        Record("report.pdf", "", "folder2", 100),
        Record("other.pdf", "C", "folder3", 100),
        Record("report.pdf", "XY", "folder4", 100),
    };

    std::cout << "[Test] Grouping by size..." << std::endl;
    SizeIndexMap index = SizeIndex::buildIndex(records);
    assert(index.size() == 2);
    assert(index.at(100).size() == 4);
    assert(index.at(50).size() == 1);
    assert(SizeIndex::countDuplicateRecords(index) == 4);
    std::cout << "[PASS] Grouping" << std::endl;

    std::cout << "[Test] Duplicates-only catalog..." << std::endl;
    Catalog dupes = SizeIndex::toCatalog(index, true);
    assert(dupes.size() == 1);
    assert(dupes[0].sizeBytes == 100);
    assert(dupes[0].files.size() == 2);

    const FileGroup& report = dupes[0].files[0];
    assert(report.filename == "report.pdf");
    assert(report.locations.size() == 3);
    assert(report.locations[0].folder == "folder1");
    assert(report.locations[1].folder == "folder2");
    assert(report.codesString() == "AB;XY");
    assert(dupes[0].files[1].filename == "other.pdf");
    assert(dupes[0].files[1].codesString() == "C");

    CatalogStats stats = ComputeStats(dupes);
    assert(stats.sizeGroups == 1);
    assert(stats.fileEntries == 2);
    assert(stats.totalLocations == 4);
    std::cout << "[PASS] Duplicates-only catalog" << std::endl;

    std::cout << "[Test] All sizes, ascending..." << std::endl;
    Catalog all = SizeIndex::toCatalog(index, false);
    assert(all.size() == 2);
    assert(all[0].sizeBytes == 50);
    assert(all[0].files[0].codesString().empty());
    std::cout << "[PASS] All sizes" << std::endl;

    std::cout << "[Test] Deterministic output..." << std::endl;
    Catalog again = SizeIndex::toCatalog(SizeIndex::buildIndex(records), true);
    assert(again.size() == dupes.size());
    for (size_t i = 0; i < again[0].files.size(); ++i) {
        assert(again[0].files[i].filename == dupes[0].files[i].filename);
        assert(again[0].files[i].locations == dupes[0].files[i].locations);
    }
    std::cout << "[PASS] Deterministic output" << std::endl;

    std::cout << "[Test] Codes string parsing..." << std::endl;
    auto codes = ParseCodesString("AB;XY");
    assert(codes.size() == 2 && codes.count("AB") && codes.count("XY"));
    assert(ParseCodesString("").empty());
    std::cout << "[PASS] Codes string parsing" << std::endl;

    std::cout << "[PASS] SizeIndexTest" << std::endl;
    return 0;
}
