/**
 * @file ToKHierarchy.cpp
 * @brief Implementation of ToKHierarchy.
 */

#include "domain/ToKHierarchy.hpp"
#include <algorithm>

namespace pdfcatalog::domain {

ToKHierarchy ToKHierarchy::buildTree(std::vector<ClassificationEntry> entries) {
    // Ascending order places every proper prefix before the codes it prefixes,
    // so a parent is always registered before its children are looked up.
    std::stable_sort(entries.begin(), entries.end(),
                     [](const ClassificationEntry& a, const ClassificationEntry& b) { return a.code < b.code; });

    ToKHierarchy tree;
    tree.m_nodes.reserve(entries.size());

    for (const auto& entry : entries) {
        if (tree.m_byCode.count(entry.code)) {
            continue;
        }

        ClassificationNode node;
        node.code = entry.code;
        node.label = entry.label;

        int index = static_cast<int>(tree.m_nodes.size());
        if (entry.code.size() > 1) {
            auto parentIt = tree.m_byCode.find(entry.code.substr(0, entry.code.size() - 1));
            if (parentIt != tree.m_byCode.end()) {
                node.parent = parentIt->second;
            }
        }

        tree.m_nodes.push_back(std::move(node));
        tree.m_byCode.emplace(entry.code, index);

        int parent = tree.m_nodes.back().parent;
        if (parent >= 0) {
            tree.m_nodes[static_cast<size_t>(parent)].children.push_back(index);
        } else {
            tree.m_roots.push_back(index);
        }
    }
    return tree;
}

const ClassificationNode* ToKHierarchy::find(const std::string& code) const {
    auto it = m_byCode.find(code);
    if (it == m_byCode.end()) return nullptr;
    return &m_nodes[static_cast<size_t>(it->second)];
}

std::vector<const ClassificationNode*> ToKHierarchy::ancestors(const std::string& code) const {
    std::vector<const ClassificationNode*> path;
    auto it = m_byCode.find(code);
    if (it == m_byCode.end()) return path;

    for (int index = it->second; index >= 0; index = m_nodes[static_cast<size_t>(index)].parent) {
        path.push_back(&m_nodes[static_cast<size_t>(index)]);
    }
    std::reverse(path.begin(), path.end());
    return path;
}

} // namespace pdfcatalog::domain
