/**
 * @file PdfCatalogApp.cpp
 * @brief Implementation of the PdfCatalogApp class.
 */
#include "app/PdfCatalogApp.hpp"

#include <iostream>
#include <string>

#include "application/CatalogSession.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/Log.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/ReportWriter.hpp"

namespace pdfcatalog::app {

namespace fs = std::filesystem;
using application::CatalogSession;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

std::optional<int> ParseRow(const std::string& text) {
    try {
        size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        if (consumed != text.size()) return std::nullopt;
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

void PrintBareIndex(const domain::BarePdfIndex& index) {
    if (index.empty()) {
        std::cout << "No bare PDF files found in " << index.folder() << std::endl;
        return;
    }
    for (const auto& row : index.rows()) {
        std::cout << row.displayIndex << "\t" << row.filename << std::endl;
    }
}

} // namespace

void PdfCatalogApp::PrintUsage() {
    std::cerr <<
        "Usage: pdfcatalog [--config FILE] [--root DIR] [--all-sizes] [--quiet] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  scan                      Scan the library, diff with the saved catalog, save if changed\n"
        "  report                    Write the prefixed-PDF report (pattern, filename, folder, title)\n"
        "  bare [DIR]                List bare PDFs in DIR (default: current folder), newest first\n"
        "  apply DIR ROW CODE        Prefix the bare PDF at ROW with a known ToK code\n"
        "  rename DIR ROW NEWNAME    Rename the bare PDF at ROW\n"
        "  tok list                  Show the ToK tree\n"
        "  tok add CODE LABEL        Add a ToK entry\n"
        "  tok update OLD NEW LABEL  Change the code and label of entry OLD\n"
        "  tok delete CODE           Delete a ToK entry\n"
        "  analyze [OUTFILE]         Report duplicates outside protected folders\n"
        "  init-config               Write a settings.json with the default values\n";
}

std::optional<PdfCatalogApp::Options> PdfCatalogApp::ParseArgs(int argc, char** argv) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (!options.args.empty()) {
            options.args.push_back(arg);
        } else if (arg == "--config" || arg == "--root") {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return std::nullopt;
            }
            (arg == "--config" ? options.configPath : options.root) = fs::path(argv[++i]);
        } else if (arg == "--quiet" || arg == "-q") {
            options.quiet = true;
        } else if (arg == "--all-sizes") {
            options.allSizes = true;
        } else if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Unknown option: " << arg << std::endl;
            return std::nullopt;
        } else {
            options.args.push_back(arg);
        }
    }
    if (options.args.empty()) {
        return std::nullopt;
    }
    return options;
}

int PdfCatalogApp::Run(int argc, char** argv) {
    std::optional<Options> options = ParseArgs(argc, argv);
    if (!options) {
        PrintUsage();
        return kExitUsage;
    }
    infrastructure::Log::SetQuiet(options->quiet);

    m_config = infrastructure::ConfigLoader::Load(options->configPath);
    if (options->root) {
        m_config.libraryRoot = *options->root;
    }
    if (options->allSizes) {
        m_config.duplicatesOnly = false;
    }
    infrastructure::ConfigLoader::ResolveDefaults(m_config);

    try {
        return Dispatch(*options);
    } catch (const domain::CatalogError& e) {
        std::cerr << "[PdfCatalogApp] Error: " << e.what() << std::endl;
        return kExitError;
    } catch (const std::exception& e) {
        std::cerr << "[PdfCatalogApp] Unexpected error: " << e.what() << std::endl;
        return kExitError;
    }
}

int PdfCatalogApp::Dispatch(const Options& options) {
    const std::string& command = options.args.front();
    std::vector<std::string> rest(options.args.begin() + 1, options.args.end());

    if (command == "init-config") {
        return CmdInitConfig(options);
    }

    CatalogSession session(m_config);
    if (command == "scan") return CmdScan(session);
    if (command == "report") return CmdReport(session);
    if (command == "bare") return CmdBare(session, rest);
    if (command == "apply") return CmdApply(session, rest);
    if (command == "rename") return CmdRename(session, rest);
    if (command == "tok") return CmdTok(session, rest);
    if (command == "analyze") return CmdAnalyze(session, rest);

    std::cerr << "Unknown command: " << command << std::endl;
    PrintUsage();
    return kExitUsage;
}

int PdfCatalogApp::CmdScan(CatalogSession& session) {
    auto pending = session.refreshCatalogAsync();
    if (!pending) {
        return kExitError;
    }
    CatalogSession::RefreshOutcome outcome = pending->get();

    std::cout << "Total PDFs found: " << outcome.totalFiles << std::endl;
    std::cout << "Files with duplicate sizes: " << outcome.duplicateFiles << std::endl;

    if (!outcome.diff.hasChanges) {
        std::cout << "No differences detected from previous scan. Catalog was not updated." << std::endl;
        return kExitOk;
    }

    std::cout << "\nFound " << outcome.diff.entries.size() << " difference(s):\n" << std::endl;
    for (const auto& entry : outcome.diff.entries) {
        std::cout << "  " << entry.message << std::endl;
    }
    if (outcome.saved) {
        std::cout << std::endl;
        if (outcome.saved->backupPath) {
            std::cout << "Old catalog backed up to: " << outcome.saved->backupPath->string() << std::endl;
        }
        std::cout << "New catalog saved to: " << outcome.saved->writtenPath.string() << std::endl;
        std::cout << "The catalog contains " << outcome.saved->stats.fileEntries << " unique filenames across "
                  << outcome.saved->stats.totalLocations << " locations." << std::endl;
    }
    return kExitOk;
}

int PdfCatalogApp::CmdReport(CatalogSession& session) {
    CatalogSession::PatternReport report = session.writePatternReport();
    if (report.rows.empty()) {
        std::cout << "No PDFs matching the pattern were found." << std::endl;
    } else {
        std::cout << "Found " << report.rows.size() << " PDFs with ToK indices." << std::endl;
    }
    std::cout << "Report written to: " << report.reportPath.string() << std::endl;
    return kExitOk;
}

int PdfCatalogApp::CmdBare(CatalogSession& session, const std::vector<std::string>& args) {
    fs::path folder = args.empty() ? fs::current_path() : fs::path(args[0]);
    PrintBareIndex(session.listBareFiles(folder));
    return kExitOk;
}

int PdfCatalogApp::CmdApply(CatalogSession& session, const std::vector<std::string>& args) {
    if (args.size() != 3) {
        PrintUsage();
        return kExitUsage;
    }
    auto row = ParseRow(args[1]);
    if (!row) {
        std::cerr << "Invalid row: " << args[1] << std::endl;
        return kExitUsage;
    }

    session.listBareFiles(args[0]);
    std::string newFilename = session.applyPrefixToRow(*row, args[2]);
    std::cout << "Added prefix '" << args[2] << "' to file: " << newFilename << std::endl;
    return kExitOk;
}

int PdfCatalogApp::CmdRename(CatalogSession& session, const std::vector<std::string>& args) {
    if (args.size() != 3) {
        PrintUsage();
        return kExitUsage;
    }
    auto row = ParseRow(args[1]);
    if (!row) {
        std::cerr << "Invalid row: " << args[1] << std::endl;
        return kExitUsage;
    }

    session.listBareFiles(args[0]);
    session.renameRow(*row, args[2]);
    std::cout << "Renamed row " << *row << " to: " << args[2] << std::endl;
    return kExitOk;
}

int PdfCatalogApp::CmdTok(CatalogSession& session, const std::vector<std::string>& args) {
    application::ClassificationService& tok = session.classification();
    const std::string sub = args.empty() ? "list" : args[0];

    auto printBackup = [](const std::optional<fs::path>& backup) {
        if (backup) std::cout << "Backup: " << backup->filename().string() << std::endl;
    };

    if (sub == "list") {
        const domain::ToKHierarchy& tree = tok.tree();
        if (tree.empty()) {
            std::cout << "No ToK codes found in database." << std::endl;
            return kExitOk;
        }
        tree.visit([](const domain::ClassificationNode& node, int depth) {
            std::cout << std::string(static_cast<size_t>(depth) * 2, ' ') << node.code << "  " << node.label << std::endl;
        });
        std::cout << "Loaded " << tok.entries().size() << " ToK codes" << std::endl;
        return kExitOk;
    }
    if (sub == "add" && args.size() == 3) {
        printBackup(tok.add(args[1], args[2]));
        std::cout << "Added ToK entry: " << args[1] << " - " << args[2] << std::endl;
        return kExitOk;
    }
    if (sub == "update" && args.size() == 4) {
        printBackup(tok.update(args[1], args[2], args[3]));
        std::cout << "Updated ToK: '" << args[1] << "' -> '" << args[2] << "' - '" << args[3] << "'" << std::endl;
        return kExitOk;
    }
    if (sub == "delete" && args.size() == 2) {
        domain::ClassificationEntry removed = tok.remove(args[1]);
        printBackup(tok.lastBackup());
        std::cout << "Deleted ToK entry: " << removed.code << " - " << removed.label << std::endl;
        return kExitOk;
    }

    PrintUsage();
    return kExitUsage;
}

int PdfCatalogApp::CmdAnalyze(CatalogSession& session, const std::vector<std::string>& args) {
    domain::DuplicateAnalyzer analyzer = session.makeAnalyzer();
    domain::DuplicateAnalysis analysis = analyzer.analyze(session.loadSavedCatalog());

    std::cout << infrastructure::ReportWriter::formatDuplicateSummary(analysis, analyzer);

    fs::path output = args.empty() ? m_config.catalogPath.parent_path() / "duplicate-analysis.txt" : fs::path(args[0]);
    infrastructure::ReportWriter::write(output, infrastructure::ReportWriter::formatDuplicateDetails(analysis, analyzer));
    std::cout << "\nDetailed report saved to: " << output.string() << std::endl;
    return kExitOk;
}

int PdfCatalogApp::CmdInitConfig(const Options& options) {
    fs::path target = options.configPath ? *options.configPath : infrastructure::PathUtils::GetDefaultSettingsPath();
    if (!infrastructure::ConfigLoader::SaveDefaults(target, m_config)) {
        std::cerr << "[PdfCatalogApp] Settings already exist at " << target.string() << std::endl;
        return kExitError;
    }
    std::cout << "Settings written to " << target.string() << std::endl;
    return kExitOk;
}

} // namespace pdfcatalog::app
