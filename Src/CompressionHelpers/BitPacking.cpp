#include "BitPacking.hpp"
#include "CodecErrors.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace huffpack::algorithms
{
    void BitWriter::writeBit(bool bit)
    {
        bitBuffer = static_cast<uint8_t>((bitBuffer << 1) | (bit ? 1 : 0));
        ++bitCount;
        if (bitCount == 8)
        {
            output.push_back(bitBuffer);
            bitBuffer = 0;
            bitCount = 0;
        }
    }

    void BitWriter::writeBits(uint64_t value, uint8_t count)
    {
        if (count > 64)
            throw std::invalid_argument("count must be between 0 and 64");

        for (uint8_t i = count; i > 0; --i)
        {
            writeBit((value >> (i - 1)) & 1);
        }
    }

    void BitWriter::writeCode(const Code& code)
    {
        for (size_t i = 0; i < code.size(); ++i)
        {
            writeBit(code[i]);
        }
    }

    std::vector<uint8_t> BitWriter::finish(uint8_t& padding)
    {
        padding = 0;
        if (bitCount > 0)
        {
            padding = static_cast<uint8_t>(8 - bitCount);
            output.push_back(static_cast<uint8_t>(bitBuffer << padding));
            bitBuffer = 0;
            bitCount = 0;
        }
        return std::move(output);
    }

    BitReader::BitReader(const uint8_t* data, size_t bitLength)
    : data(data)
    , bitLength(bitLength)
    {}

    bool BitReader::readBit(bool& bit)
    {
        if (position >= bitLength) return false;

        uint8_t byte = data[position / 8];
        bit = (byte >> (7 - position % 8)) & 1;
        ++position;
        return true;
    }

    bool BitReader::readBits(uint8_t count, uint64_t& value)
    {
        if (count > 64 || remainingBits() < count) return false;

        value = 0;
        for (uint8_t i = 0; i < count; ++i)
        {
            bool bit = false;
            readBit(bit);
            value = (value << 1) | (bit ? 1 : 0);
        }
        return true;
    }

    PackedPayload BitPacking::pack(
        const std::vector<uint8_t>& input,
        const CodeTable& codes
    ) {
        BitWriter writer;
        writer.reserve(input.size() / 2 + 1);

        for (uint8_t byte : input)
        {
            writer.writeCode(codes.at(byte));
        }

        PackedPayload payload;
        payload.bytes = writer.finish(payload.padding);
        return payload;
    }

    std::vector<uint8_t> BitPacking::unpack(
        const PackedPayload& payload,
        uint64_t originalSize,
        const HuffmanTree& tree
    ) {
        if (tree.empty())
            throw std::logic_error("Cannot decode without a tree");

        const size_t totalBits = payload.bytes.size() * 8;
        if (payload.padding > 7 || payload.padding > totalBits)
            throw CorruptPayloadError(
                "Padding of " + std::to_string(payload.padding) + " bits exceeds the payload"
            );
        if (payload.padding > 0)
        {
            uint8_t mask = static_cast<uint8_t>((1u << payload.padding) - 1);
            if (payload.bytes.back() & mask)
                throw CorruptPayloadError("Padding bits are not zero");
        }

        BitReader reader(payload.bytes.data(), totalBits - payload.padding);

        // every symbol costs at least one bit
        std::vector<uint8_t> decoded;
        decoded.reserve(static_cast<size_t>(std::min<uint64_t>(originalSize, reader.remainingBits())));

        const int32_t rootIndex = tree.rootIndex();
        bool bit = false;

        while (decoded.size() < originalSize)
        {
            if (tree.isSingleLeaf())
            {
                if (!reader.readBit(bit))
                    throw CorruptPayloadError(
                        "Bitstream exhausted after " + std::to_string(decoded.size())
                        + " of " + std::to_string(originalSize) + " bytes"
                    );
                if (bit)
                    throw CorruptPayloadError("Unexpected 1 bit for a single-symbol tree");
                decoded.push_back(tree.root().symbol);
                continue;
            }

            int32_t current = rootIndex;
            while (!tree.node(current).isLeaf())
            {
                if (!reader.readBit(bit))
                {
                    if (current == rootIndex)
                        throw CorruptPayloadError(
                            "Bitstream exhausted after " + std::to_string(decoded.size())
                            + " of " + std::to_string(originalSize) + " bytes"
                        );
                    throw CorruptPayloadError("Bitstream ended inside a code");
                }
                const HuffmanNode& node = tree.node(current);
                current = bit ? node.right : node.left;
            }
            decoded.push_back(tree.node(current).symbol);
        }

        if (reader.remainingBits() > 0)
            throw CorruptPayloadError(
                std::to_string(reader.remainingBits()) + " unused bits after the last symbol"
            );

        return decoded;
    }
}
