#include <cassert>
#include <iostream>
#include <string>
#include <vector>
#include "domain/ToKHierarchy.hpp"

using namespace pdfcatalog::domain;

int main() {
    std::cout << "[Test] Chain A > AB > ABC..." << std::endl;
    {
        ToKHierarchy tree = ToKHierarchy::buildTree({{"ABC", "Deep"}, {"A", "Top"}, {"AB", "Middle"}});
        assert(tree.size() == 3);
        assert(tree.roots().size() == 1);

        const ClassificationNode& root = tree.node(tree.roots()[0]);
        assert(root.code == "A");
        assert(root.children.size() == 1);
        const ClassificationNode& middle = tree.node(root.children[0]);
        assert(middle.code == "AB");
        assert(tree.node(middle.children[0]).code == "ABC");

        auto path = tree.ancestors("ABC");
        assert(path.size() == 3);
        assert(path[0]->code == "A" && path[1]->code == "AB" && path[2]->code == "ABC");
        assert(tree.ancestors("ZZ").empty());
    }
    std::cout << "[PASS] Chain" << std::endl;

    std::cout << "[Test] Orphan becomes a root..." << std::endl;
    {
        // "XY" has no "X" entry, so it sits at the top level.
        ToKHierarchy tree = ToKHierarchy::buildTree({{"A", "Top"}, {"XY", "Orphan"}, {"XYZ", "Child"}});
        assert(tree.roots().size() == 2);
        assert(tree.node(tree.roots()[1]).code == "XY");
        assert(tree.find("XYZ")->parent == tree.roots()[1]);
    }
    std::cout << "[PASS] Orphan" << std::endl;

    std::cout << "[Test] Forest traversal order..." << std::endl;
    {
        ToKHierarchy tree = ToKHierarchy::buildTree(
            {{"B", "Second"}, {"AB", "A child"}, {"A", "First"}, {"BA", "B child"}, {"AA", "A first child"}});
        std::vector<std::string> order;
        std::vector<int> depths;
        tree.visit([&](const ClassificationNode& node, int depth) {
            order.push_back(node.code);
            depths.push_back(depth);
        });
        assert((order == std::vector<std::string>{"A", "AA", "AB", "B", "BA"}));
        assert((depths == std::vector<int>{0, 1, 1, 0, 1}));
        assert(tree.contains("BA"));
        assert(!tree.contains("C"));
    }
    std::cout << "[PASS] Forest" << std::endl;

    std::cout << "[Test] Empty input..." << std::endl;
    {
        ToKHierarchy tree = ToKHierarchy::buildTree({});
        assert(tree.empty());
        assert(tree.roots().empty());
        assert(tree.find("A") == nullptr);
    }
    std::cout << "[PASS] Empty input" << std::endl;

    std::cout << "[PASS] ToKHierarchyTest" << std::endl;
    return 0;
}
