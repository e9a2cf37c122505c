#include "ContainerCodec.hpp"
#include "CodecErrors.hpp"
#include <algorithm>
#include <bitset>
#include <limits>
#include <stdexcept>
#include <string>

namespace
{
    using namespace huffpack::algorithms;

    // a 256 leaf tree has 511 nodes and is at most 255 levels deep
    constexpr size_t MAX_TREE_DEPTH = SYMBOL_COUNT - 1;

    template <typename T>
    void appendLittleEndian(std::vector<uint8_t>& output, T value)
    {
        for (size_t b = 0; b < sizeof(T); ++b)
        {
            output.push_back(static_cast<uint8_t>((value >> (8 * b)) & 0xFF));
        }
    }

    class HeaderReader
    {
      private:
        const std::vector<uint8_t>& buffer;
        size_t offset = 0;

      public:
        explicit HeaderReader(const std::vector<uint8_t>& buffer) : buffer(buffer) {}

        size_t position() const { return offset; }

        void require(size_t count, const char* field) const
        {
            if (buffer.size() - offset < count)
                throw huffpack::InvalidFormatError(std::string("Truncated container while reading ") + field);
        }

        template <typename T>
        T readLittleEndian(const char* field)
        {
            require(sizeof(T), field);
            T value = 0;
            for (size_t b = 0; b < sizeof(T); ++b)
            {
                value |= static_cast<T>(buffer[offset++]) << (8 * b);
            }
            return value;
        }

        std::string readString(size_t length, const char* field)
        {
            require(length, field);
            std::string value(buffer.begin() + offset, buffer.begin() + offset + length);
            offset += length;
            return value;
        }

        void skip(size_t count) { offset += count; }
    };

    void writeSubtree(const HuffmanTree& tree, int32_t index, BitWriter& writer)
    {
        const HuffmanNode& node = tree.node(index);
        if (node.isLeaf())
        {
            writer.writeBit(TREE_TAG_LEAF);
            writer.writeBits(node.symbol, 8);
            return;
        }
        writer.writeBit(TREE_TAG_INTERNAL);
        writeSubtree(tree, node.left, writer);
        writeSubtree(tree, node.right, writer);
    }

    int32_t readSubtree(
        HuffmanTree& tree,
        BitReader& reader,
        std::bitset<SYMBOL_COUNT>& seen,
        size_t depth
    ) {
        if (depth > MAX_TREE_DEPTH)
            throw huffpack::InvalidFormatError("Tree exceeds the maximum depth of " + std::to_string(MAX_TREE_DEPTH));

        bool tag = false;
        if (!reader.readBit(tag))
            throw huffpack::InvalidFormatError("Truncated tree");

        if (tag == TREE_TAG_LEAF)
        {
            uint64_t symbol = 0;
            if (!reader.readBits(8, symbol))
                throw huffpack::InvalidFormatError("Truncated tree leaf");
            if (seen.test(symbol))
                throw huffpack::InvalidFormatError("Symbol " + std::to_string(symbol) + " appears in two leaves");
            seen.set(symbol);
            return tree.addLeaf(static_cast<uint8_t>(symbol));
        }

        int32_t left = readSubtree(tree, reader, seen, depth + 1);
        int32_t right = readSubtree(tree, reader, seen, depth + 1);
        return tree.addInternal(left, right);
    }
}

void huffpack::algorithms::ContainerCodec::writeTree(
    const HuffmanTree& tree,
    BitWriter& writer
) {
    if (tree.empty())
        throw std::logic_error("Cannot serialize an empty tree");
    writeSubtree(tree, tree.rootIndex(), writer);
}

huffpack::algorithms::HuffmanTree huffpack::algorithms::ContainerCodec::readTree(
    BitReader& reader
) {
    HuffmanTree tree;
    std::bitset<SYMBOL_COUNT> seen;
    tree.setRoot(readSubtree(tree, reader, seen, 0));
    return tree;
}

std::vector<uint8_t> huffpack::algorithms::ContainerCodec::serialize(
    const Container& container
) {
    if (container.extension.size() > std::numeric_limits<uint32_t>::max())
        throw CodecError(
            CodecStage::CONTAINER_SERIALIZATION, ErrorKind::INTERNAL, "Extension is too long"
        );
    if (container.payload.padding > 7)
        throw CodecError(
            CodecStage::CONTAINER_SERIALIZATION, ErrorKind::INTERNAL, "Padding must be between 0 and 7"
        );

    std::vector<uint8_t> output;
    output.reserve(CONTAINER_FIXED_HEADER_SIZE + container.extension.size() + container.payload.bytes.size() + 64);

    output.insert(output.end(), CONTAINER_MAGIC.begin(), CONTAINER_MAGIC.end());
    output.push_back(CONTAINER_VERSION);

    appendLittleEndian<uint32_t>(output, static_cast<uint32_t>(container.extension.size()));
    output.insert(output.end(), container.extension.begin(), container.extension.end());

    appendLittleEndian<uint64_t>(output, container.originalSize);
    output.push_back(container.payload.padding);

    BitWriter treeWriter;
    writeTree(container.tree, treeWriter);
    uint8_t treePadding = 0;
    std::vector<uint8_t> treeBytes = treeWriter.finish(treePadding);
    output.insert(output.end(), treeBytes.begin(), treeBytes.end());

    output.insert(output.end(), container.payload.bytes.begin(), container.payload.bytes.end());
    return output;
}

huffpack::algorithms::Container huffpack::algorithms::ContainerCodec::deserialize(
    const std::vector<uint8_t>& buffer
) {
    HeaderReader header(buffer);

    header.require(CONTAINER_MAGIC.size(), "format marker");
    if (!std::equal(CONTAINER_MAGIC.begin(), CONTAINER_MAGIC.end(), buffer.begin()))
        throw InvalidFormatError("Missing HUFP format marker");
    header.skip(CONTAINER_MAGIC.size());

    uint8_t version = header.readLittleEndian<uint8_t>("format version");
    if (version != CONTAINER_VERSION)
        throw InvalidFormatError("Unsupported container version " + std::to_string(version));

    Container container;
    uint32_t extensionLength = header.readLittleEndian<uint32_t>("extension length");
    container.extension = header.readString(extensionLength, "extension");

    container.originalSize = header.readLittleEndian<uint64_t>("original size");
    if (container.originalSize == 0)
        throw InvalidFormatError("Container records an empty original payload");

    container.payload.padding = header.readLittleEndian<uint8_t>("padding count");
    if (container.payload.padding > 7)
        throw InvalidFormatError("Padding count " + std::to_string(container.payload.padding) + " is out of range");

    const size_t treeOffset = header.position();
    BitReader treeReader(buffer.data() + treeOffset, (buffer.size() - treeOffset) * 8);
    container.tree = readTree(treeReader);

    // the rest of the tree's last byte must be zero filler
    while (treeReader.bitPosition() % 8 != 0)
    {
        bool bit = false;
        treeReader.readBit(bit);
        if (bit)
            throw InvalidFormatError("Non-zero padding after the tree");
    }

    const size_t payloadOffset = treeOffset + treeReader.consumedBytes();
    container.payload.bytes.assign(buffer.begin() + payloadOffset, buffer.end());
    return container;
}
