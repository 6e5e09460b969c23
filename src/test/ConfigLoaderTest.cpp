#include <cassert>
#include <filesystem>
#include <iostream>
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace fs = std::filesystem;
using namespace pdfcatalog::infrastructure;

int main() {
    fs::path root = fs::temp_directory_path() / "pdfcatalog_config_test";
    fs::remove_all(root);
    fs::create_directories(root);
    fs::path settings = root / "settings.json";

    std::cout << "[Test] Missing settings use defaults..." << std::endl;
    AppConfig config = ConfigLoader::Load(settings);
    assert(config.libraryRoot.empty());
    assert(config.duplicatesOnly);
    assert(config.excludeDirs.size() == 1 && config.excludeDirs[0] == "RAG");
    assert(config.protectedFolders.size() == 4);
    std::cout << "[PASS] Missing settings" << std::endl;

    std::cout << "[Test] Paths derive from the library root..." << std::endl;
    config.libraryRoot = root / "library";
    ConfigLoader::ResolveDefaults(config);
    assert(config.catalogPath == root / "library" / "pdfmanager" / "pdf-files-by-size.json");
    assert(config.tokPath == root / "library" / "pdfmanager" / "pdf_manager_tok_init.json");
    assert(config.reportDir == root / "library" / "coffeetable");
    std::cout << "[PASS] Derived paths" << std::endl;

    std::cout << "[Test] Settings file overrides..." << std::endl;
    PersistenceService::writeTextAtomic(settings, R"({
        "library_root": "/data/pdfs",
        "exclude_dirs": ["RAG", "tmp"],
        "report_dir": "/data/reports",
        "duplicates_only": false,
        "ignored_folders": []
    })");
    AppConfig loaded = ConfigLoader::Load(settings);
    ConfigLoader::ResolveDefaults(loaded);
    assert(loaded.libraryRoot == fs::path("/data/pdfs"));
    assert(loaded.excludeDirs.size() == 2);
    assert(!loaded.duplicatesOnly);
    assert(loaded.ignoredFolders.empty());
    assert(loaded.reportDir == fs::path("/data/reports"));
    assert(loaded.catalogPath == fs::path("/data/pdfs/pdfmanager/pdf-files-by-size.json"));
    std::cout << "[PASS] Overrides" << std::endl;

    std::cout << "[Test] Malformed settings fall back to defaults..." << std::endl;
    PersistenceService::writeTextAtomic(settings, "{ broken");
    AppConfig fallback = ConfigLoader::Load(settings);
    assert(fallback.libraryRoot.empty());
    assert(fallback.duplicatesOnly);
    std::cout << "[PASS] Malformed settings" << std::endl;

    std::cout << "[Test] SaveDefaults never overwrites..." << std::endl;
    fs::path fresh = root / "nested" / "settings.json";
    assert(ConfigLoader::SaveDefaults(fresh, config));
    AppConfig reread = ConfigLoader::Load(fresh);
    assert(reread.libraryRoot == config.libraryRoot);
    assert(reread.catalogPath == config.catalogPath);
    assert(!ConfigLoader::SaveDefaults(fresh, config));
    std::cout << "[PASS] SaveDefaults" << std::endl;

    fs::remove_all(root);
    std::cout << "[PASS] ConfigLoaderTest" << std::endl;
    return 0;
}
