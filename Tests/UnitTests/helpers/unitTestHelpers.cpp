#include "unitTestHelpers.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>

std::string createTempFile(const std::string& filename, const std::string& content)
{
    std::ofstream file(filename, std::ios::binary);
    file << content;
    file.close();
    return filename;
}

std::vector<uint8_t> readTempFile(const std::string& filename)
{
    std::ifstream file(filename, std::ios::binary);
    return std::vector<uint8_t>(
        (std::istreambuf_iterator<char>(file)),
        std::istreambuf_iterator<char>()
    );
}

bool tempFileExists(const std::string& filename)
{
    return std::filesystem::exists(filename);
}

std::vector<uint8_t> toBytes(const std::string& text)
{
    return std::vector<uint8_t>(text.begin(), text.end());
}

std::string codeToString(const huffpack::algorithms::Code& code)
{
    std::string bits;
    for (size_t i = 0; i < code.size(); ++i)
    {
        bits += code[i] ? '1' : '0';
    }
    return bits;
}

std::vector<uint8_t> genRandomTextInput(size_t size, unsigned seed)
{
    const std::string popularSymbols = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
    std::mt19937 generator(seed);
    std::uniform_int_distribution<size_t> pick(0, popularSymbols.size() - 1);

    std::vector<uint8_t> res;
    res.reserve(size);
    for (size_t i = 0; i < size; i++) {
        res.push_back(static_cast<uint8_t>(popularSymbols[pick(generator)]));
    }
    return res;
}

std::vector<uint8_t> genRandomBinaryInput(size_t size, unsigned seed)
{
    std::mt19937 generator(seed);
    std::uniform_int_distribution<int> byte(0, 255);

    std::vector<uint8_t> res;
    res.reserve(size);
    for (size_t i = 0; i < size; i++) {
        res.push_back(static_cast<uint8_t>(byte(generator)));
    }
    return res;
}
