/**
 * @file PdfMetadataReader.hpp
 * @brief Reads embedded PDF metadata through poppler's pdfinfo tool.
 */

#pragma once
#include <string>

namespace pdfcatalog::infrastructure {

class PdfMetadataReader {
public:
    /**
     * @brief Returns the document's Title entry.
     * @return "" when the document has no title, or "[Error: <cause>]" when
     * pdfinfo cannot parse it. A parse failure is data, never an exception.
     */
    static std::string ReadTitle(const std::string& path);

    /** @brief Extracts the Title value from pdfinfo output, "" if absent. */
    static std::string ParseTitle(const std::string& pdfinfoOutput);

private:
    struct CommandResult {
        std::string output;
        int exitCode = -1;
    };

    static CommandResult RunCommand(const std::string& cmd);
    static std::string ShellQuote(const std::string& value);
};

} // namespace pdfcatalog::infrastructure
