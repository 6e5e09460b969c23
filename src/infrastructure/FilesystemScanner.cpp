/**
 * @file FilesystemScanner.cpp
 * @brief Implementation of the FilesystemScanner.
 */

#include "infrastructure/FilesystemScanner.hpp"
#include "domain/Errors.hpp"
#include "domain/PrefixCodec.hpp"
#include "infrastructure/Log.hpp"
#include "infrastructure/PdfMetadataReader.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace pdfcatalog::infrastructure {

namespace {

std::chrono::system_clock::time_point FromTimespec(const struct timespec& ts) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec)));
}

} // namespace

FilesystemScanner::FilesystemScanner(fs::path root, std::set<std::string> excludeDirNames)
    : m_root(std::move(root)), m_excludeDirNames(std::move(excludeDirNames)), m_titleReader(PdfMetadataReader::ReadTitle) {}

bool FilesystemScanner::isPdfName(const std::string& filename) {
    if (filename.size() < 4) return false;
    std::string ext = filename.substr(filename.size() - 4);
    // Convert extension to lowercase for robust check
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return std::tolower(c); });
    return ext == ".pdf";
}

void FilesystemScanner::requireRoot() const {
    std::error_code ec;
    if (!fs::is_directory(m_root, ec)) {
        throw domain::NotFoundError("Library root not found: " + m_root.string());
    }
}

std::string FilesystemScanner::relativeFolder(const fs::path& dir) const {
    fs::path rel = dir.lexically_relative(m_root);
    if (rel.empty() || rel == ".") {
        return domain::kRootFolderToken;
    }
    return rel.generic_string();
}

void FilesystemScanner::walk(const fs::path& dir, const FileVisitor& visitor) const {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        Log::Error("FilesystemScanner", "Cannot read directory " + dir.string() + ": " + ec.message());
        return;
    }

    const std::string folder = relativeFolder(dir);
    std::vector<fs::path> subdirs;

    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            Log::Error("FilesystemScanner", "Error listing " + dir.string() + ": " + ec.message());
            break;
        }
        const fs::directory_entry& entry = *it;
        const std::string name = entry.path().filename().string();

        std::error_code typeEc;
        // Symlinked directories are not followed.
        if (entry.is_directory(typeEc) && !entry.is_symlink(typeEc)) {
            if (m_excludeDirNames.count(name) == 0) {
                subdirs.push_back(entry.path());
            }
            continue;
        }
        if (!isPdfName(name) || !entry.is_regular_file(typeEc)) {
            continue;
        }
        visitor(entry.path(), folder);
    }

    std::sort(subdirs.begin(), subdirs.end());
    for (const auto& sub : subdirs) {
        walk(sub, visitor);
    }
}

std::vector<domain::FileRecord> FilesystemScanner::scan() const {
    requireRoot();
    std::vector<domain::FileRecord> records;

    walk(m_root, [&records](const fs::path& file, const std::string& folder) {
        struct stat st;
        if (::stat(file.c_str(), &st) != 0) {
            Log::Error("FilesystemScanner", "Error accessing " + file.string() + ": " + std::strerror(errno));
            return;
        }

        const std::string filename = file.filename().string();
        domain::PrefixCodec::Split split = domain::PrefixCodec::splitFilename(filename);

        domain::FileRecord record;
        record.baseFilename = split.baseFilename;
        record.classificationCode = domain::PrefixCodec::prefixToCode(split.prefix);
        record.folder = folder;
        record.sizeBytes = static_cast<long long>(st.st_size);
        record.createdAt = FromTimespec(st.st_ctim);
        record.modifiedAt = FromTimespec(st.st_mtim);
        records.push_back(std::move(record));
    });

    Log::Info("FilesystemScanner", "Scanned " + std::to_string(records.size()) + " PDFs under " + m_root.string());
    return records;
}

std::vector<domain::PatternedFile> FilesystemScanner::scanPatternedOnly() const {
    requireRoot();
    std::vector<domain::PatternedFile> results;

    walk(m_root, [this, &results](const fs::path& file, const std::string& folder) {
        const std::string filename = file.filename().string();
        auto prefix = domain::PrefixCodec::parsePrefix(filename);
        if (!prefix) {
            return;
        }

        domain::PrefixCodec::Split split = domain::PrefixCodec::splitFilename(filename);
        domain::PatternedFile row;
        row.prefix = *prefix;
        row.baseFilename = split.baseFilename;
        row.folder = folder;
        row.internalTitle = m_titleReader ? m_titleReader(file.string()) : std::string();
        results.push_back(std::move(row));
    });

    Log::Info("FilesystemScanner", "Found " + std::to_string(results.size()) + " PDFs with a classification prefix");
    return results;
}

domain::BarePdfIndex FilesystemScanner::listBareFiles(const fs::path& folder) {
    std::error_code ec;
    if (!fs::is_directory(folder, ec)) {
        throw domain::NotFoundError("Folder not found: " + folder.string());
    }

    struct Candidate {
        std::string name;
        fs::file_time_type mtime;
    };
    std::vector<Candidate> candidates;

    fs::directory_iterator it(folder, ec);
    if (ec) {
        throw domain::IOError("Cannot read directory " + folder.string() + ": " + ec.message());
    }
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            throw domain::IOError("Error listing " + folder.string() + ": " + ec.message());
        }
        const std::string name = it->path().filename().string();
        std::error_code entryEc;
        if (!isPdfName(name) || !it->is_regular_file(entryEc) || !domain::PrefixCodec::isBare(name)) {
            continue;
        }
        auto mtime = fs::last_write_time(it->path(), entryEc);
        if (entryEc) {
            Log::Error("FilesystemScanner", "Error accessing " + it->path().string() + ": " + entryEc.message());
            continue;
        }
        candidates.push_back({name, mtime});
    }

    // Most recent first; ties broken by name so the numbering is reproducible.
    std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        if (a.mtime != b.mtime) return a.mtime > b.mtime;
        return a.name < b.name;
    });

    std::vector<std::string> names;
    names.reserve(candidates.size());
    for (auto& c : candidates) names.push_back(std::move(c.name));
    return domain::BarePdfIndex(folder.string(), names);
}

} // namespace pdfcatalog::infrastructure
