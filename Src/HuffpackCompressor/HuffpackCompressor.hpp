#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "../Helpers/Result.hpp"
#include "../CompressionHelpers/Huffman.hpp"

namespace huffpack
{
    namespace compressor
    {
        using algorithms::CompressionStatistics;
        using algorithms::CompressedData;
        using algorithms::DecompressedData;

        struct CompressionReport
        {
            std::string inputPath;
            std::string outputPath;
            CompressionStatistics statistics;
        };

        struct DecompressionReport
        {
            std::string inputPath;
            std::string outputPath;
            std::string extension;
            uint64_t originalSize = 0;
            uint64_t decompressedSize = 0;
        };

        Result<CompressedData> compressBuffer(
            std::vector<uint8_t> const &data,
            std::string const &extension
        );

        Result<DecompressedData> decompressBuffer(
            std::vector<uint8_t> const &container
        );

        Result<CompressionReport> compressFile(
            std::string const &inputPath,
            std::string const &outputPath = "",
            bool verbose = false
        );

        Result<DecompressionReport> decompressFile(
            std::string const &inputPath,
            std::string const &outputPath = "",
            bool verbose = false
        );
    }
}
