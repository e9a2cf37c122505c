#pragma once
#ifndef HUFFPACK_BITPACKING_HPP
#define HUFFPACK_BITPACKING_HPP

#include <cstddef>
#include <cstdint>
#include <vector>
#include "CodeTable.hpp"
#include "HuffmanTree.hpp"

namespace huffpack::algorithms
{
    struct PackedPayload
    {
        std::vector<uint8_t> bytes;
        uint8_t padding = 0;    // trailing filler bits in the last byte, 0..7
    };

    // Bits are written most significant first within each byte.
    class BitWriter
    {
      private:
        std::vector<uint8_t> output;
        uint8_t bitBuffer = 0;
        uint8_t bitCount = 0;

      public:
        BitWriter() = default;

        void reserve(size_t bytes) { output.reserve(bytes); }

        void writeBit(bool bit);
        void writeBits(uint64_t value, uint8_t count);
        void writeCode(const Code& code);

        size_t bitLength() const { return output.size() * 8 + bitCount; }

        // Flushes the partial byte with zero bits and reports how many were added.
        std::vector<uint8_t> finish(uint8_t& padding);
    };

    class BitReader
    {
      private:
        const uint8_t* data = nullptr;
        size_t bitLength = 0;
        size_t position = 0;

      public:
        BitReader(const uint8_t* data, size_t bitLength);

        bool readBit(bool& bit);
        bool readBits(uint8_t count, uint64_t& value);

        size_t remainingBits() const { return bitLength - position; }
        size_t consumedBytes() const { return (position + 7) / 8; }
        size_t bitPosition() const { return position; }
    };

    struct BitPacking
    {
        static PackedPayload pack(
            const std::vector<uint8_t>& input,
            const CodeTable& codes
        );

        // Throws CorruptPayloadError unless exactly originalSize symbols decode
        // from the non-padding bits.
        static std::vector<uint8_t> unpack(
            const PackedPayload& payload,
            uint64_t originalSize,
            const HuffmanTree& tree
        );
    };
}

#endif // HUFFPACK_BITPACKING_HPP
