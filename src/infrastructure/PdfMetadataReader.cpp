/**
 * @file PdfMetadataReader.cpp
 * @brief Implementation of PdfMetadataReader.
 */

#include "infrastructure/PdfMetadataReader.hpp"
#include <cstdio>
#include <sstream>
#include <sys/wait.h>

namespace pdfcatalog::infrastructure {

namespace {

std::string Trim(const std::string& value) {
    size_t first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

} // namespace

PdfMetadataReader::CommandResult PdfMetadataReader::RunCommand(const std::string& cmd) {
    CommandResult result;
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) return result;
    char buffer[256];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        result.output.append(buffer);
    }
    int status = pclose(pipe);
    result.exitCode = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
    return result;
}

std::string PdfMetadataReader::ShellQuote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted += "'";
    return quoted;
}

std::string PdfMetadataReader::ParseTitle(const std::string& pdfinfoOutput) {
    std::istringstream lines(pdfinfoOutput);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.rfind("Title:", 0) == 0) {
            return Trim(line.substr(6));
        }
    }
    return "";
}

std::string PdfMetadataReader::ReadTitle(const std::string& path) {
    CommandResult result = RunCommand("pdfinfo -enc UTF-8 " + ShellQuote(path) + " 2>&1");
    if (result.exitCode != 0) {
        std::string cause = Trim(result.output.substr(0, result.output.find('\n')));
        if (cause.empty()) {
            cause = "pdfinfo exited with code " + std::to_string(result.exitCode);
        }
        return "[Error: " + cause + "]";
    }
    return ParseTitle(result.output);
}

} // namespace pdfcatalog::infrastructure
