#pragma once
#ifndef HUFFPACK_HUFFMAN_TREE_HPP
#define HUFFPACK_HUFFMAN_TREE_HPP

#include <cstddef>
#include <cstdint>
#include <vector>
#include "FrequencyAnalyzer.hpp"

namespace huffpack::algorithms
{
    constexpr int32_t NO_CHILD = -1;

    struct HuffmanNode
    {
        uint64_t weight;
        int32_t left;
        int32_t right;
        uint8_t symbol;     // leaves only

        bool isLeaf() const
        {
            return left == NO_CHILD && right == NO_CHILD;
        }
    };

    /*
     * Arena of nodes linked by index. Children are always appended before
     * their parent, so the arena can never contain a cycle.
     */
    class HuffmanTree
    {
      private:
        std::vector<HuffmanNode> nodes;
        int32_t rootNode = NO_CHILD;

        bool sameShape(const HuffmanTree& other, int32_t lhs, int32_t rhs) const;

      public:
        HuffmanTree() = default;

        // Minimum-weight-first merge. Ties go to the node created first:
        // leaves in ascending byte order, then merged nodes in creation order.
        static HuffmanTree build(const FrequencyTable& frequencies);

        int32_t addLeaf(uint8_t symbol, uint64_t weight = 0);
        int32_t addInternal(int32_t left, int32_t right);
        void setRoot(int32_t index);

        const HuffmanNode& node(int32_t index) const;
        const HuffmanNode& root() const;
        int32_t rootIndex() const { return rootNode; }

        size_t size() const { return nodes.size(); }
        size_t leafCount() const;
        bool empty() const { return rootNode == NO_CHILD; }
        bool isSingleLeaf() const { return !empty() && root().isLeaf(); }

        // Same topology and same leaf symbols; weights are not compared.
        bool sameShape(const HuffmanTree& other) const;
    };
}

#endif // HUFFPACK_HUFFMAN_TREE_HPP
