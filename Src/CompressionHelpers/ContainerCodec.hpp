#pragma once
#ifndef HUFFPACK_CONTAINER_CODEC_HPP
#define HUFFPACK_CONTAINER_CODEC_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "BitPacking.hpp"
#include "HuffmanTree.hpp"

namespace huffpack::algorithms
{
    constexpr std::array<uint8_t, 4> CONTAINER_MAGIC = {'H', 'U', 'F', 'P'};
    constexpr uint8_t CONTAINER_VERSION = 1;

    // magic + version + extension length + original size + padding
    constexpr size_t CONTAINER_FIXED_HEADER_SIZE = 4 + 1 + 4 + 8 + 1;

    constexpr uint8_t TREE_TAG_INTERNAL = 0;
    constexpr uint8_t TREE_TAG_LEAF = 1;

    struct Container
    {
        std::string extension;
        uint64_t originalSize = 0;
        HuffmanTree tree;
        PackedPayload payload;
    };

    /*
     * Layout, integers little-endian:
     *   "HUFP" | version u8 | extension length u32 | extension bytes
     *   | original size u64 | padding u8 | tree bits (byte aligned) | payload
     *
     * The tree is written pre-order: a 0 bit for an internal node followed by
     * its left and right subtrees, a 1 bit for a leaf followed by its 8 bit symbol.
     */
    struct ContainerCodec
    {
        static std::vector<uint8_t> serialize(const Container& container);

        // Throws InvalidFormatError on any header or tree grammar violation.
        static Container deserialize(const std::vector<uint8_t>& buffer);

        static void writeTree(const HuffmanTree& tree, BitWriter& writer);
        static HuffmanTree readTree(BitReader& reader);
    };
}

#endif // HUFFPACK_CONTAINER_CODEC_HPP
