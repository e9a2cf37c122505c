#include "HuffmanTree.hpp"
#include "CodecErrors.hpp"
#include <queue>
#include <stdexcept>
#include <utility>

namespace
{
    // (weight, creation sequence)
    using QueueEntry = std::pair<uint64_t, int32_t>;

    struct Compare
    {
        bool operator()(const QueueEntry& l, const QueueEntry& r) const
        {
            if (l.first != r.first) return l.first > r.first;
            return l.second > r.second;
        }
    };
}

namespace huffpack::algorithms
{
    HuffmanTree HuffmanTree::build(const FrequencyTable& frequencies)
    {
        HuffmanTree tree;
        std::priority_queue<QueueEntry, std::vector<QueueEntry>, Compare> queue;

        for (size_t symbol = 0; symbol < SYMBOL_COUNT; ++symbol)
        {
            uint64_t count = frequencies.counts[symbol];
            if (count == 0) continue;

            int32_t leaf = tree.addLeaf(static_cast<uint8_t>(symbol), count);
            queue.push({count, leaf});
        }
        if (queue.empty())
            throw EmptyInputError(CodecStage::TREE_CONSTRUCTION);

        while (queue.size() > 1)
        {
            QueueEntry left = queue.top();
            queue.pop();

            QueueEntry right = queue.top();
            queue.pop();

            int32_t parent = tree.addInternal(left.second, right.second);
            queue.push({tree.node(parent).weight, parent});
        }

        tree.setRoot(queue.top().second);
        return tree;
    }

    int32_t HuffmanTree::addLeaf(uint8_t symbol, uint64_t weight)
    {
        nodes.push_back(HuffmanNode{weight, NO_CHILD, NO_CHILD, symbol});
        return static_cast<int32_t>(nodes.size() - 1);
    }

    int32_t HuffmanTree::addInternal(int32_t left, int32_t right)
    {
        const int32_t next = static_cast<int32_t>(nodes.size());
        if (left < 0 || right < 0 || left >= next || right >= next || left == right)
            throw std::logic_error("Internal node must link two distinct existing nodes");

        uint64_t weight = nodes[left].weight + nodes[right].weight;
        nodes.push_back(HuffmanNode{weight, left, right, 0});
        return next;
    }

    void HuffmanTree::setRoot(int32_t index)
    {
        if (index < 0 || static_cast<size_t>(index) >= nodes.size())
            throw std::logic_error("Root index out of range");
        rootNode = index;
    }

    const HuffmanNode& HuffmanTree::node(int32_t index) const
    {
        if (index < 0 || static_cast<size_t>(index) >= nodes.size())
            throw std::logic_error("Node index out of range");
        return nodes[index];
    }

    const HuffmanNode& HuffmanTree::root() const
    {
        return node(rootNode);
    }

    size_t HuffmanTree::leafCount() const
    {
        size_t leaves = 0;
        for (const HuffmanNode& n : nodes)
        {
            if (n.isLeaf()) ++leaves;
        }
        return leaves;
    }

    bool HuffmanTree::sameShape(const HuffmanTree& other) const
    {
        if (empty() || other.empty()) return empty() && other.empty();
        return sameShape(other, rootNode, other.rootNode);
    }

    bool HuffmanTree::sameShape(const HuffmanTree& other, int32_t lhs, int32_t rhs) const
    {
        const HuffmanNode& a = node(lhs);
        const HuffmanNode& b = other.node(rhs);
        if (a.isLeaf() || b.isLeaf())
        {
            return a.isLeaf() && b.isLeaf() && a.symbol == b.symbol;
        }
        return sameShape(other, a.left, b.left) && sameShape(other, a.right, b.right);
    }
}
