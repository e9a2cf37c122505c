#include "HuffpackCompressor/HuffpackCompressor.hpp"
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace
{
    std::string withThousandsSeparators(int64_t value)
    {
        std::string digits = std::to_string(value < 0 ? -value : value);
        std::string grouped;
        for (size_t i = 0; i < digits.size(); ++i)
        {
            if (i > 0 && (digits.size() - i) % 3 == 0) grouped += ',';
            grouped += digits[i];
        }
        return value < 0 ? "-" + grouped : grouped;
    }

    template <typename T>
    void printWarnings(const huffpack::Result<T> &result)
    {
        for (const auto &warning : result.getWarnings())
        {
            std::cerr << "Warning: " << warning << std::endl;
        }
    }

    int runCompress(const std::string &inputPath, const std::string &outputPath, bool verbose)
    {
        auto result = huffpack::compressor::compressFile(inputPath, outputPath, verbose);
        if (!result.success())
        {
            std::cerr << "Error during compression: " << result.getError() << std::endl;
            return 1;
        }
        printWarnings(result);

        const auto report = result.getValue();
        const auto &stats = report.statistics;
        std::ostringstream ratio;
        ratio << std::fixed << std::setprecision(2) << stats.compressionRatio;

        std::cout << "\nCompression successful!" << std::endl;
        std::cout << "Original file: " << report.inputPath << std::endl;
        std::cout << "Compressed file: " << report.outputPath << std::endl;
        std::cout << "Original size: " << withThousandsSeparators(stats.originalSize) << " bytes" << std::endl;
        std::cout << "Compressed size: " << withThousandsSeparators(stats.compressedSize) << " bytes" << std::endl;
        std::cout << "Space saved: " << withThousandsSeparators(stats.spaceSaved) << " bytes" << std::endl;
        std::cout << "Compression ratio: " << ratio.str() << "%" << std::endl;
        return 0;
    }

    int runDecompress(const std::string &inputPath, const std::string &outputPath, bool verbose)
    {
        auto result = huffpack::compressor::decompressFile(inputPath, outputPath, verbose);
        if (!result.success())
        {
            std::cerr << "Error during decompression: " << result.getError() << std::endl;
            return 1;
        }
        printWarnings(result);

        const auto report = result.getValue();
        std::cout << "\nDecompression successful!" << std::endl;
        std::cout << "Compressed file: " << report.inputPath << std::endl;
        std::cout << "Decompressed file: " << report.outputPath << std::endl;
        std::cout << "Original size: " << withThousandsSeparators(report.originalSize) << " bytes" << std::endl;
        std::cout << "Decompressed size: " << withThousandsSeparators(report.decompressedSize) << " bytes" << std::endl;
        return 0;
    }

    void runMenu(bool verbose)
    {
        std::cout << "Huffman File Compression Tool" << std::endl;
        std::cout << std::string(40, '=') << std::endl;

        std::string choice;
        while (true)
        {
            std::cout << "\nOptions:\n1. Compress file\n2. Decompress file\n3. Exit" << std::endl;
            std::cout << "\nEnter your choice (1-3): ";
            if (!std::getline(std::cin, choice)) break;

            if (choice == "1" || choice == "2")
            {
                std::string path;
                std::cout << (choice == "1" ? "Enter file path to compress: " : "Enter compressed file path: ");
                if (!std::getline(std::cin, path)) break;

                if (choice == "1") runCompress(path, "", verbose);
                else runDecompress(path, "", verbose);
            }
            else if (choice == "3")
            {
                std::cout << "Goodbye!" << std::endl;
                break;
            }
            else
            {
                std::cout << "Invalid choice. Please try again." << std::endl;
            }
        }
    }

    void printUsage(const char *program)
    {
        std::cerr << "Usage: " << program << " [--verbose] compress <file> [output]\n"
                  << "       " << program << " [--verbose] decompress <file> [output]\n"
                  << "       " << program << " [--verbose]    (interactive menu)" << std::endl;
    }
}

int main(int argc, char **argv)
{
    bool verbose = false;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") verbose = true;
        else if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        else args.push_back(arg);
    }

    if (args.empty())
    {
        runMenu(verbose);
        return 0;
    }
    if (args.size() < 2 || args.size() > 3)
    {
        printUsage(argv[0]);
        return 2;
    }

    const std::string outputPath = args.size() == 3 ? args[2] : "";
    if (args[0] == "compress") return runCompress(args[1], outputPath, verbose);
    if (args[0] == "decompress") return runDecompress(args[1], outputPath, verbose);

    printUsage(argv[0]);
    return 2;
}
