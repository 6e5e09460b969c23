/**
 * @file Classification.hpp
 * @brief Classification (ToK) entries and the derived tree node.
 */

#pragma once
#include <string>
#include <vector>

namespace pdfcatalog::domain {

/**
 * @struct ClassificationEntry
 * @brief One code/label pair of the flat, authoritative classification list.
 */
struct ClassificationEntry {
    std::string code;   ///< Alphanumeric, no separators, unique across the list.
    std::string label;  ///< Free text, may repeat.

    bool operator==(const ClassificationEntry& other) const {
        return code == other.code && label == other.label;
    }
};

/**
 * @struct ClassificationNode
 * @brief Read-only tree view over an entry. Children are indices into the
 * owning hierarchy's node storage, in ascending code order.
 */
struct ClassificationNode {
    std::string code;
    std::string label;
    int parent = -1;            ///< Index of the parent node, -1 for roots.
    std::vector<int> children;
};

} // namespace pdfcatalog::domain
