/**
 * @file BarePdfIndex.cpp
 * @brief Implementation of BarePdfIndex.
 */

#include "domain/BarePdfIndex.hpp"

namespace pdfcatalog::domain {

BarePdfIndex::BarePdfIndex(std::string folder, const std::vector<std::string>& filenamesNewestFirst)
    : m_folder(std::move(folder)), m_valid(true) {
    m_rows.reserve(filenamesNewestFirst.size());
    int index = 1;
    for (const auto& name : filenamesNewestFirst) {
        m_rows.push_back({index++, name});
    }
}

std::optional<std::string> BarePdfIndex::filenameAt(int displayIndex) const {
    if (displayIndex < 1 || static_cast<size_t>(displayIndex) > m_rows.size()) {
        return std::nullopt;
    }
    return m_rows[static_cast<size_t>(displayIndex - 1)].filename;
}

} // namespace pdfcatalog::domain
