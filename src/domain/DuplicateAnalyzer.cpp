/**
 * @file DuplicateAnalyzer.cpp
 * @brief Implementation of DuplicateAnalyzer.
 */

#include "domain/DuplicateAnalyzer.hpp"
#include <algorithm>

namespace pdfcatalog::domain {

namespace {

// Scanner folders are relative ("a/documents/b"), so a leading component has
// no slash before it and is matched separately.
bool MatchesAny(const std::string& folder, const std::vector<std::string>& names) {
    for (const auto& name : names) {
        if (name.empty()) continue;
        if (folder == name || folder.rfind(name + "/", 0) == 0 || folder.find("/" + name) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace

std::vector<std::pair<std::string, const std::vector<DeletableFile>*>> DuplicateAnalysis::sortedFolders() const {
    std::vector<std::pair<std::string, const std::vector<DeletableFile>*>> folders;
    for (const auto& [folder, files] : deletableByFolder) {
        folders.emplace_back(folder, &files);
    }
    std::stable_sort(folders.begin(), folders.end(), [](const auto& a, const auto& b) {
        return a.second->size() > b.second->size();
    });
    return folders;
}

DuplicateAnalyzer::DuplicateAnalyzer(std::vector<std::string> protectedFolders, std::vector<std::string> ignoredFolders)
    : m_protected(std::move(protectedFolders)), m_ignored(std::move(ignoredFolders)) {}

bool DuplicateAnalyzer::isProtected(const std::string& folder) const {
    return MatchesAny(folder, m_protected);
}

bool DuplicateAnalyzer::isIgnored(const std::string& folder) const {
    return MatchesAny(folder, m_ignored);
}

DuplicateAnalysis DuplicateAnalyzer::analyze(const Catalog& catalog) const {
    DuplicateAnalysis analysis;

    for (const auto& group : catalog) {
        for (const auto& file : group.files) {
            std::vector<std::string> protectedLocations;
            std::vector<std::string> otherLocations;

            for (const auto& loc : file.locations) {
                if (isIgnored(loc.folder)) continue;
                if (isProtected(loc.folder)) {
                    protectedLocations.push_back(loc.folder);
                } else {
                    otherLocations.push_back(loc.folder);
                }
            }

            if (protectedLocations.empty() || otherLocations.empty()) {
                continue;
            }

            analysis.filesInProtected++;
            analysis.deletableDuplicates += otherLocations.size();
            for (const auto& folder : otherLocations) {
                analysis.deletableByFolder[folder].push_back({file.filename, group.sizeBytes, protectedLocations});
            }
        }
    }
    return analysis;
}

} // namespace pdfcatalog::domain
