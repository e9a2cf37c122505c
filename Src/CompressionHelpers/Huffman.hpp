#ifndef HUFFPACK_HUFFMAN_HPP
#define HUFFPACK_HUFFMAN_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace huffpack::algorithms
{
    struct CompressionStatistics
    {
        uint64_t originalSize = 0;
        uint64_t compressedSize = 0;
        double compressionRatio = 0.0;  // percent, negative when the output grew
        int64_t spaceSaved = 0;
    };

    struct CompressedData
    {
        std::vector<uint8_t> container;
        CompressionStatistics statistics;
    };

    struct DecompressedData
    {
        std::vector<uint8_t> data;
        std::string extension;
    };

    struct Huffman
    {
        static CompressedData compress(
            const std::vector<uint8_t>& input,
            const std::string& extension = ""
        );

        static DecompressedData decompress(const std::vector<uint8_t>& container);

        static CompressionStatistics computeStatistics(
            uint64_t originalSize,
            uint64_t compressedSize
        );
    };
} // huffpack::algorithms

#endif // HUFFPACK_HUFFMAN_HPP
