/**
 * @file ToKHierarchy.hpp
 * @brief Reconstructs the classification forest from a flat entry list.
 */

#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "domain/Classification.hpp"

namespace pdfcatalog::domain {

/**
 * @class ToKHierarchy
 * @brief Immutable forest built by prefix truncation.
 *
 * A node's parent is the node whose code equals its own code minus the last
 * character, when that code is present; otherwise the node is a root. The
 * hierarchy is always rebuilt from the entry list and never edited in place.
 */
class ToKHierarchy {
public:
    ToKHierarchy() = default;

    /** @brief Builds the forest. Duplicate codes keep the first entry seen after sorting. */
    static ToKHierarchy buildTree(std::vector<ClassificationEntry> entries);

    /** @brief Indices of root nodes in ascending code order. */
    const std::vector<int>& roots() const { return m_roots; }

    const ClassificationNode& node(int index) const { return m_nodes.at(static_cast<size_t>(index)); }

    /** @brief Looks up a node by code. */
    const ClassificationNode* find(const std::string& code) const;

    bool contains(const std::string& code) const { return find(code) != nullptr; }

    /** @brief Nodes from the root down to the given code, empty if unknown. */
    std::vector<const ClassificationNode*> ancestors(const std::string& code) const;

    /** @brief Depth-first pre-order traversal; depth 0 for roots. */
    template <typename Visitor>
    void visit(Visitor&& visitor) const {
        for (int root : m_roots) {
            visitFrom(root, 0, visitor);
        }
    }

    size_t size() const { return m_nodes.size(); }
    bool empty() const { return m_nodes.empty(); }

private:
    template <typename Visitor>
    void visitFrom(int index, int depth, Visitor& visitor) const {
        const ClassificationNode& current = node(index);
        visitor(current, depth);
        for (int child : current.children) {
            visitFrom(child, depth + 1, visitor);
        }
    }

    std::vector<ClassificationNode> m_nodes;
    std::vector<int> m_roots;
    std::unordered_map<std::string, int> m_byCode;
};

} // namespace pdfcatalog::domain
