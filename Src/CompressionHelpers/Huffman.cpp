#include "Huffman.hpp"
#include "BitPacking.hpp"
#include "CodeTable.hpp"
#include "CodecErrors.hpp"
#include "ContainerCodec.hpp"
#include "FrequencyAnalyzer.hpp"
#include "HuffmanTree.hpp"
#include <utility>

namespace huffpack::algorithms
{
    CompressedData Huffman::compress(
        const std::vector<uint8_t>& input,
        const std::string& extension
    ) {
        if (input.empty())
            throw EmptyInputError(CodecStage::FREQUENCY_ANALYSIS);

        FrequencyTable frequencies = FrequencyAnalyzer::analyze(input);
        HuffmanTree tree = HuffmanTree::build(frequencies);
        CodeTable codes = CodeTable::generate(tree);

        Container container;
        container.extension = extension;
        container.originalSize = input.size();
        container.payload = BitPacking::pack(input, codes);
        container.tree = std::move(tree);

        CompressedData compressed;
        compressed.container = ContainerCodec::serialize(container);
        compressed.statistics = computeStatistics(input.size(), compressed.container.size());
        return compressed;
    }

    DecompressedData Huffman::decompress(const std::vector<uint8_t>& buffer)
    {
        Container container = ContainerCodec::deserialize(buffer);

        DecompressedData decompressed;
        decompressed.data = BitPacking::unpack(container.payload, container.originalSize, container.tree);
        decompressed.extension = std::move(container.extension);
        return decompressed;
    }

    CompressionStatistics Huffman::computeStatistics(
        uint64_t originalSize,
        uint64_t compressedSize
    ) {
        CompressionStatistics statistics;
        statistics.originalSize = originalSize;
        statistics.compressedSize = compressedSize;
        statistics.spaceSaved = static_cast<int64_t>(originalSize) - static_cast<int64_t>(compressedSize);
        if (originalSize > 0)
        {
            statistics.compressionRatio =
                (1.0 - static_cast<double>(compressedSize) / static_cast<double>(originalSize)) * 100.0;
        }
        return statistics;
    }
}
