/**
 * @file SnapshotDiffer.cpp
 * @brief Implementation of SnapshotDiffer.
 */

#include "domain/SnapshotDiffer.hpp"
#include <algorithm>
#include <map>
#include <set>

namespace pdfcatalog::domain {

namespace {

/** @brief size -> filename -> file group, for keyed lookups over a catalog. */
using KeyedCatalog = std::map<long long, std::map<std::string, const FileGroup*>>;

KeyedCatalog Key(const Catalog& catalog) {
    KeyedCatalog keyed;
    for (const auto& group : catalog) {
        auto& files = keyed[group.sizeBytes];
        for (const auto& file : group.files) {
            files.emplace(file.filename, &file);
        }
    }
    return keyed;
}

std::string TokDisplay(const std::string& codes) {
    return codes.empty() ? std::string() : " [ToK: " + codes + "]";
}

DiffEntry MakeNew(long long size, const FileGroup& file) {
    DiffEntry entry;
    entry.kind = DiffKind::New;
    entry.sizeBytes = size;
    entry.filename = file.filename;
    entry.newCodes = file.codesString();
    entry.message = "NEW: " + file.filename + TokDisplay(entry.newCodes) +
                    " (size: " + SnapshotDiffer::formatBytes(size) + " bytes, " +
                    std::to_string(file.locations.size()) + " location(s))";
    return entry;
}

DiffEntry MakeRemoved(long long size, const FileGroup& file) {
    DiffEntry entry;
    entry.kind = DiffKind::Removed;
    entry.sizeBytes = size;
    entry.filename = file.filename;
    entry.oldCodes = file.codesString();
    entry.message = "REMOVED: " + file.filename + TokDisplay(entry.oldCodes) +
                    " (size: " + SnapshotDiffer::formatBytes(size) + " bytes, was in " +
                    std::to_string(file.locations.size()) + " location(s))";
    return entry;
}

std::set<std::string> Folders(const FileGroup& file) {
    std::set<std::string> folders;
    for (const auto& loc : file.locations) folders.insert(loc.folder);
    return folders;
}

const Location* FindLocation(const FileGroup& file, const std::string& folder) {
    auto it = std::find_if(file.locations.begin(), file.locations.end(),
                           [&folder](const Location& loc) { return loc.folder == folder; });
    return it == file.locations.end() ? nullptr : &*it;
}

void CompareCommon(long long size, const FileGroup& oldFile, const FileGroup& newFile, std::vector<DiffEntry>& out) {
    const std::string& name = newFile.filename;

    std::string oldCodes = oldFile.codesString();
    std::string newCodes = newFile.codesString();
    if (oldCodes != newCodes) {
        DiffEntry entry;
        entry.kind = DiffKind::ClassificationChanged;
        entry.sizeBytes = size;
        entry.filename = name;
        entry.oldCodes = oldCodes;
        entry.newCodes = newCodes;
        entry.message = "TOK CHANGED: " + name + " - '" + oldCodes + "' -> '" + newCodes + "'";
        out.push_back(std::move(entry));
    }

    std::set<std::string> oldFolders = Folders(oldFile);
    std::set<std::string> newFolders = Folders(newFile);

    for (const auto& folder : newFolders) {
        if (oldFolders.count(folder)) continue;
        DiffEntry entry;
        entry.kind = DiffKind::MovedTo;
        entry.sizeBytes = size;
        entry.filename = name;
        entry.folder = folder;
        entry.message = "MOVED/COPIED: " + name + " now in: " + folder;
        out.push_back(std::move(entry));
    }

    for (const auto& folder : oldFolders) {
        if (newFolders.count(folder)) continue;
        DiffEntry entry;
        entry.kind = DiffKind::MovedFrom;
        entry.sizeBytes = size;
        entry.filename = name;
        entry.folder = folder;
        entry.message = "MOVED/DELETED: " + name + " no longer in: " + folder;
        out.push_back(std::move(entry));
    }

    for (const auto& folder : newFolders) {
        if (!oldFolders.count(folder)) continue;
        const Location* oldLoc = FindLocation(oldFile, folder);
        const Location* newLoc = FindLocation(newFile, folder);
        if (oldLoc->created != newLoc->created || oldLoc->modified != newLoc->modified) {
            DiffEntry entry;
            entry.kind = DiffKind::Modified;
            entry.sizeBytes = size;
            entry.filename = name;
            entry.folder = folder;
            entry.message = "MODIFIED: " + name + " in " + folder + " - dates changed";
            out.push_back(std::move(entry));
        }
    }
}

} // namespace

const char* ToString(DiffKind kind) {
    switch (kind) {
        case DiffKind::Info: return "INFO";
        case DiffKind::New: return "NEW";
        case DiffKind::Removed: return "REMOVED";
        case DiffKind::MovedTo: return "MOVED_TO";
        case DiffKind::MovedFrom: return "MOVED_FROM";
        case DiffKind::Modified: return "MODIFIED";
        case DiffKind::ClassificationChanged: return "CLASSIFICATION_CHANGED";
    }
    return "UNKNOWN";
}

size_t DiffResult::count(DiffKind kind) const {
    return static_cast<size_t>(std::count_if(entries.begin(), entries.end(),
                                             [kind](const DiffEntry& e) { return e.kind == kind; }));
}

std::string SnapshotDiffer::formatBytes(long long value) {
    bool negative = value < 0;
    std::string digits = std::to_string(negative ? -value : value);
    std::string out;
    int counter = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (counter > 0 && counter % 3 == 0) out.push_back(',');
        out.push_back(*it);
        ++counter;
    }
    if (negative) out.push_back('-');
    std::reverse(out.begin(), out.end());
    return out;
}

DiffResult SnapshotDiffer::diff(const std::optional<Catalog>& previous, const Catalog& current) {
    DiffResult result;

    if (!previous) {
        DiffEntry entry;
        entry.kind = DiffKind::Info;
        entry.message = "No previous JSON file found - this is the first scan";
        result.entries.push_back(std::move(entry));
        result.hasChanges = true;
        return result;
    }

    KeyedCatalog oldData = Key(*previous);
    KeyedCatalog newData = Key(current);

    std::set<long long> sizes;
    for (const auto& kv : oldData) sizes.insert(kv.first);
    for (const auto& kv : newData) sizes.insert(kv.first);

    static const std::map<std::string, const FileGroup*> kEmpty;

    for (long long size : sizes) {
        auto oldIt = oldData.find(size);
        auto newIt = newData.find(size);
        const auto& oldFiles = oldIt != oldData.end() ? oldIt->second : kEmpty;
        const auto& newFiles = newIt != newData.end() ? newIt->second : kEmpty;

        std::set<std::string> names;
        for (const auto& kv : oldFiles) names.insert(kv.first);
        for (const auto& kv : newFiles) names.insert(kv.first);

        for (const auto& name : names) {
            auto o = oldFiles.find(name);
            auto n = newFiles.find(name);
            if (o == oldFiles.end()) {
                result.entries.push_back(MakeNew(size, *n->second));
            } else if (n == newFiles.end()) {
                result.entries.push_back(MakeRemoved(size, *o->second));
            } else {
                CompareCommon(size, *o->second, *n->second, result.entries);
            }
        }
    }

    result.hasChanges = !result.entries.empty();
    return result;
}

} // namespace pdfcatalog::domain
