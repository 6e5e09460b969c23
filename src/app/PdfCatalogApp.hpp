/**
 * @file PdfCatalogApp.hpp
 * @brief Command-line front end for the PDF catalog.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "infrastructure/ConfigLoader.hpp"

namespace pdfcatalog::application {
class CatalogSession;
}

namespace pdfcatalog::app {

/**
 * @class PdfCatalogApp
 * @brief Parses the command line, builds a session and dispatches one command.
 */
class PdfCatalogApp {
public:
    /**
     * @brief Runs one command.
     * @return 0 on success, 1 on a reported error, 2 on a usage error.
     */
    int Run(int argc, char** argv);

private:
    /** @brief Global options and the remaining positional arguments. */
    struct Options {
        std::optional<std::filesystem::path> configPath;
        std::optional<std::filesystem::path> root;
        bool quiet = false;
        bool allSizes = false;
        std::vector<std::string> args;
    };

    static std::optional<Options> ParseArgs(int argc, char** argv);
    static void PrintUsage();

    int Dispatch(const Options& options);

    int CmdScan(application::CatalogSession& session);
    int CmdReport(application::CatalogSession& session);
    int CmdBare(application::CatalogSession& session, const std::vector<std::string>& args);
    int CmdApply(application::CatalogSession& session, const std::vector<std::string>& args);
    int CmdRename(application::CatalogSession& session, const std::vector<std::string>& args);
    int CmdTok(application::CatalogSession& session, const std::vector<std::string>& args);
    int CmdAnalyze(application::CatalogSession& session, const std::vector<std::string>& args);
    int CmdInitConfig(const Options& options);

    infrastructure::AppConfig m_config;
};

} // namespace pdfcatalog::app
