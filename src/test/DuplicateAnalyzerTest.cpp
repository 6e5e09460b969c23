#include <cassert>
#include <iostream>
#include "domain/DuplicateAnalyzer.hpp"

using namespace pdfcatalog::domain;

static Location Loc(const std::string& folder) {
    return {folder, "2024-01-01 00:00:00", "2024-01-01 00:00:00"};
}

int main() {
    DuplicateAnalyzer analyzer({"documents", "1hugefiles"}, {"pdfmanager"});

    std::cout << "[Test] Folder matching..." << std::endl;
    assert(analyzer.isProtected("documents"));
    assert(analyzer.isProtected("documents/sub"));
    assert(analyzer.isProtected("archive/1hugefiles"));
    assert(analyzer.isProtected("a/documents/b"));
    assert(!analyzer.isProtected("downloads"));
    assert(!analyzer.isProtected("mydocuments"));
    assert(analyzer.isIgnored("pdfmanager"));
    assert(!analyzer.isIgnored("[root]"));
    std::cout << "[PASS] Folder matching" << std::endl;

    std::cout << "[Test] Deletable duplicates..." << std::endl;
    Catalog catalog = {
        {100, {{"kept.pdf", {}, {Loc("documents"), Loc("downloads"), Loc("desktop"), Loc("pdfmanager")}},
               {"loose.pdf", {}, {Loc("downloads"), Loc("desktop")}}}},
        {200, {{"both-protected.pdf", {}, {Loc("documents"), Loc("1hugefiles")}},
               {"second.pdf", {}, {Loc("documents/papers"), Loc("downloads")}}}},
    };
    DuplicateAnalysis analysis = analyzer.analyze(catalog);
    assert(analysis.filesInProtected == 2);
    assert(analysis.deletableDuplicates == 3);
    assert(analysis.deletableByFolder.size() == 2);
    assert(analysis.deletableByFolder.at("downloads").size() == 2);
    assert(analysis.deletableByFolder.at("desktop").size() == 1);

    const DeletableFile& first = analysis.deletableByFolder.at("desktop")[0];
    assert(first.filename == "kept.pdf");
    assert(first.sizeBytes == 100);
    assert(first.protectedLocations.size() == 1 && first.protectedLocations[0] == "documents");

    auto folders = analysis.sortedFolders();
    assert(folders.size() == 2);
    assert(folders[0].first == "downloads");
    assert(folders[1].first == "desktop");
    std::cout << "[PASS] Deletable duplicates" << std::endl;

    std::cout << "[PASS] DuplicateAnalyzerTest" << std::endl;
    return 0;
}
