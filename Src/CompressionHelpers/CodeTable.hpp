#pragma once
#ifndef HUFFPACK_CODE_TABLE_HPP
#define HUFFPACK_CODE_TABLE_HPP

#include <array>
#include <cstdint>
#include <boost/dynamic_bitset.hpp>
#include "HuffmanTree.hpp"

namespace huffpack::algorithms
{
    // Bit i of a code is the i-th branch taken from the root (0 left, 1 right).
    using Code = boost::dynamic_bitset<>;

    class CodeTable
    {
      private:
        std::array<Code, SYMBOL_COUNT> codes;

        void assignCodes(const HuffmanTree& tree, int32_t index, Code& path);

      public:
        CodeTable() = default;

        static CodeTable generate(const HuffmanTree& tree);

        bool contains(uint8_t symbol) const
        {
            return !codes[symbol].empty();
        }

        const Code& at(uint8_t symbol) const;
        size_t size() const;
        size_t longestCode() const;
    };
}

#endif // HUFFPACK_CODE_TABLE_HPP
