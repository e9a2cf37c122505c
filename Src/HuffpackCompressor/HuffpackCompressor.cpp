#include "HuffpackCompressor.hpp"
#include "../CompressionHelpers/CodecErrors.hpp"
#include "../Helpers/FileHelpers.hpp"
#include <exception>
#include <iostream>
#include <stdexcept>

namespace
{
    template <typename T, typename F>
    huffpack::Result<T> runCodec(F &&stage)
    {
        huffpack::Result<T> result;
        try
        {
            result.setValue(stage());
        }
        catch (const huffpack::CodecError &e)
        {
            result.setError(e.what(), e.getKind());
        }
        catch (const std::exception &e)
        {
            result.setError(std::string("internal error: ") + e.what(), huffpack::ErrorKind::INTERNAL);
        }
        return result;
    }
}

huffpack::Result<huffpack::compressor::CompressedData> huffpack::compressor::compressBuffer(
    std::vector<uint8_t> const &data,
    std::string const &extension
) {
    Result<CompressedData> result = runCodec<CompressedData>([&]() {
        return algorithms::Huffman::compress(data, extension);
    });
    if (result.success() && result.value->statistics.compressedSize >= data.size())
    {
        result.addWarning(
            "Compressed output (" + std::to_string(result.value->statistics.compressedSize)
            + " bytes) is not smaller than the input (" + std::to_string(data.size()) + " bytes)"
        );
    }
    return result;
}

huffpack::Result<huffpack::compressor::DecompressedData> huffpack::compressor::decompressBuffer(
    std::vector<uint8_t> const &container
) {
    return runCodec<DecompressedData>([&]() {
        return algorithms::Huffman::decompress(container);
    });
}

huffpack::Result<huffpack::compressor::CompressionReport> huffpack::compressor::compressFile(
    std::string const &inputPath,
    std::string const &outputPath,
    bool verbose
) {
    Result<CompressionReport> result;

    Result<std::vector<uint8_t>> input = files::readFile(inputPath);
    if (!input.success())
    {
        result.setError(input.getError(), input.getErrorKind());
        return result;
    }

    if (verbose)
    {
        std::cout << "Compressing " << inputPath << " (" << input.value->size() << " bytes)..." << std::endl;
    }

    Result<CompressedData> compressed = compressBuffer(*input.value, files::fileExtension(inputPath));
    if (!compressed.success())
    {
        result.setError("Failed to compress '" + inputPath + "': " + compressed.getError(), compressed.getErrorKind());
        return result;
    }
    for (const auto &warning : compressed.getWarnings())
    {
        result.addWarning(warning);
    }

    CompressionReport report;
    report.inputPath = inputPath;
    report.outputPath = outputPath.empty() ? files::compressedOutputPath(inputPath) : outputPath;
    report.statistics = compressed.value->statistics;

    if (!files::writeFile(report.outputPath, compressed.value->container))
    {
        result.setError("failed to write: " + report.outputPath, ErrorKind::IO_ERROR);
        return result;
    }

    if (verbose)
    {
        std::cout << "Wrote " << report.outputPath << " (" << report.statistics.compressedSize << " bytes)" << std::endl;
    }
    return makeResult<CompressionReport>(report, &result);
}

huffpack::Result<huffpack::compressor::DecompressionReport> huffpack::compressor::decompressFile(
    std::string const &inputPath,
    std::string const &outputPath,
    bool verbose
) {
    Result<DecompressionReport> result;

    Result<std::vector<uint8_t>> input = files::readFile(inputPath);
    if (!input.success())
    {
        result.setError(input.getError(), input.getErrorKind());
        return result;
    }

    if (verbose)
    {
        std::cout << "Decompressing " << inputPath << " (" << input.value->size() << " bytes)..." << std::endl;
    }

    Result<DecompressedData> decompressed = decompressBuffer(*input.value);
    if (!decompressed.success())
    {
        result.setError("Failed to decompress '" + inputPath + "': " + decompressed.getError(), decompressed.getErrorKind());
        return result;
    }

    DecompressionReport report;
    report.inputPath = inputPath;
    report.extension = decompressed.value->extension;
    report.outputPath = outputPath.empty()
        ? files::decompressedOutputPath(inputPath, report.extension)
        : outputPath;
    report.originalSize = decompressed.value->data.size();
    report.decompressedSize = decompressed.value->data.size();

    if (!files::writeFile(report.outputPath, decompressed.value->data))
    {
        result.setError("failed to write: " + report.outputPath, ErrorKind::IO_ERROR);
        return result;
    }

    if (verbose)
    {
        std::cout << "Wrote " << report.outputPath << " (" << report.decompressedSize << " bytes)" << std::endl;
    }
    return makeResult<DecompressionReport>(report, &result);
}
