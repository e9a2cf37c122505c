#include "CodeTable.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace huffpack::algorithms
{
    CodeTable CodeTable::generate(const HuffmanTree& tree)
    {
        if (tree.empty())
            throw std::logic_error("Cannot generate codes for an empty tree");

        CodeTable table;
        Code path;
        if (tree.isSingleLeaf())
        {
            path.push_back(false);  // lone symbol is coded as a single 0
            table.codes[tree.root().symbol] = path;
            return table;
        }

        table.assignCodes(tree, tree.rootIndex(), path);
        return table;
    }

    void CodeTable::assignCodes(const HuffmanTree& tree, int32_t index, Code& path)
    {
        const HuffmanNode& node = tree.node(index);
        if (node.isLeaf())
        {
            if (!codes[node.symbol].empty())
                throw std::logic_error("Symbol " + std::to_string(node.symbol) + " appears in two leaves");
            codes[node.symbol] = path;
            return;
        }
        if (node.left == NO_CHILD || node.right == NO_CHILD)
            throw std::logic_error("Internal node with fewer than two children");

        path.push_back(false);
        assignCodes(tree, node.left, path);
        path.pop_back();

        path.push_back(true);
        assignCodes(tree, node.right, path);
        path.pop_back();
    }

    const Code& CodeTable::at(uint8_t symbol) const
    {
        if (codes[symbol].empty())
            throw std::out_of_range("No code assigned to symbol " + std::to_string(symbol));
        return codes[symbol];
    }

    size_t CodeTable::size() const
    {
        size_t assigned = 0;
        for (const Code& code : codes)
        {
            if (!code.empty()) ++assigned;
        }
        return assigned;
    }

    size_t CodeTable::longestCode() const
    {
        size_t longest = 0;
        for (const Code& code : codes)
        {
            longest = std::max(longest, code.size());
        }
        return longest;
    }
}
