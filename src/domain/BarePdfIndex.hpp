/**
 * @file BarePdfIndex.hpp
 * @brief Row-numbered listing of unclassified PDFs in one working folder.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

namespace pdfcatalog::domain {

/**
 * @class BarePdfIndex
 * @brief Maps 1-based display rows to filenames, most recently modified first.
 *
 * The numbering is only meaningful for the directory state it was built from.
 * Once a rename happens the owner invalidates the index and every row lookup
 * fails until a fresh listing replaces it.
 */
class BarePdfIndex {
public:
    struct Row {
        int displayIndex;
        std::string filename;
    };

    BarePdfIndex() = default;
    BarePdfIndex(std::string folder, const std::vector<std::string>& filenamesNewestFirst);

    const std::string& folder() const { return m_folder; }
    const std::vector<Row>& rows() const { return m_rows; }
    size_t size() const { return m_rows.size(); }
    bool empty() const { return m_rows.empty(); }

    /** @brief False once invalidated, or for a default-constructed index. */
    bool isValid() const { return m_valid; }
    void invalidate() { m_valid = false; }

    /** @brief Filename shown at the given row; nullopt if out of range. */
    std::optional<std::string> filenameAt(int displayIndex) const;

private:
    std::string m_folder;
    std::vector<Row> m_rows;
    bool m_valid = false;
};

} // namespace pdfcatalog::domain
