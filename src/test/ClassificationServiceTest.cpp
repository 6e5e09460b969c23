#include <cassert>
#include <filesystem>
#include <iostream>
#include "application/ClassificationService.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/ClassificationStore.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace fs = std::filesystem;
using namespace pdfcatalog;
using application::ClassificationService;
using infrastructure::ClassificationStore;

template <typename E, typename F>
static bool Throws(F&& f) {
    try {
        f();
    } catch (const E&) {
        return true;
    }
    return false;
}

static size_t CountBackups(const fs::path& dir) {
    size_t n = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.path().filename().string().rfind("tok_", 0) == 0) ++n;
    }
    return n;
}

int main() {
    fs::path root = fs::temp_directory_path() / "pdfcatalog_classification_test";
    fs::remove_all(root);
    fs::create_directories(root);
    fs::path doc = root / "tok.json";

    std::cout << "[Test] Store load errors..." << std::endl;
    ClassificationStore store(doc);
    assert(!store.exists());
    assert(Throws<domain::NotFoundError>([&] { store.load(); }));
    infrastructure::PersistenceService::writeTextAtomic(doc, R"({"other": []})");
    assert(Throws<domain::FormatError>([&] { store.load(); }));
    fs::remove(doc);
    std::cout << "[PASS] Store load errors" << std::endl;

    std::cout << "[Test] First add creates the document..." << std::endl;
    ClassificationService service{ClassificationStore(doc)};
    assert(!service.add("B", "Books"));
    assert(store.exists());
    assert(store.load().size() == 1);
    std::cout << "[PASS] First add" << std::endl;

    std::cout << "[Test] Add keeps entries sorted and backs up..." << std::endl;
    auto backup = service.add(" A ", "Articles");
    assert(backup);
    assert(fs::exists(*backup));
    assert(service.entries().size() == 2);
    assert(service.entries()[0].code == "A");
    assert(service.tree().contains("A"));
    std::cout << "[PASS] Add" << std::endl;

    std::cout << "[Test] Add validation..." << std::endl;
    size_t backupsBefore = CountBackups(root);
    assert(Throws<domain::ValidationError>([&] { service.add("A", "Again"); }));
    assert(Throws<domain::ValidationError>([&] { service.add("A-1", "Dash"); }));
    assert(Throws<domain::ValidationError>([&] { service.add("C", "  "); }));
    assert(CountBackups(root) == backupsBefore);
    std::cout << "[PASS] Add validation" << std::endl;

    std::cout << "[Test] Update is keyed by the original code..." << std::endl;
    service.add("AA", "Shared label");
    service.add("AB", "Shared label");
    service.update("AB", "A C", "Renamed");
    assert(service.find("AC"));
    assert(service.find("AC")->label == "Renamed");
    assert(!service.find("AB"));
    assert(service.find("AA")->label == "Shared label");
    assert(Throws<domain::NotFoundError>([&] { service.update("ZZ", "Z", "Missing"); }));
    assert(Throws<domain::ValidationError>([&] { service.update("AC", "AA", "Clash"); }));
    assert(Throws<domain::ValidationError>([&] { service.update("AC", "A-C", "Bad"); }));
    std::cout << "[PASS] Update" << std::endl;

    std::cout << "[Test] Remove..." << std::endl;
    auto removed = service.remove("B");
    assert(removed.label == "Books");
    assert(!service.find("B"));
    assert(Throws<domain::NotFoundError>([&] { service.remove("B"); }));
    std::cout << "[PASS] Remove" << std::endl;

    std::cout << "[Test] Reload sees the saved document..." << std::endl;
    ClassificationService fresh{ClassificationStore(doc)};
    assert(fresh.entries().size() == service.entries().size());
    assert(fresh.tree().find("AC")->parent >= 0);
    std::cout << "[PASS] Reload" << std::endl;

    fs::remove_all(root);
    std::cout << "[PASS] ClassificationServiceTest" << std::endl;
    return 0;
}
