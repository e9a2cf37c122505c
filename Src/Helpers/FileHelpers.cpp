#include "FileHelpers.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

huffpack::Result<std::vector<uint8_t>> huffpack::files::readFile(
    std::string const &path
) {
    std::error_code errorCode;
    if (!fs::exists(path, errorCode) || !fs::is_regular_file(path, errorCode))
    {
        return makeError<std::vector<uint8_t>>("Input file " + path + " not found", ErrorKind::IO_ERROR);
    }

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.good())
    {
        return makeError<std::vector<uint8_t>>("failed to read: " + path, ErrorKind::IO_ERROR);
    }

    std::vector<uint8_t> data(
        (std::istreambuf_iterator<char>(ifs)),
        std::istreambuf_iterator<char>()
    );
    if (ifs.bad())
    {
        return makeError<std::vector<uint8_t>>("failed to read: " + path, ErrorKind::IO_ERROR);
    }
    return makeResult<std::vector<uint8_t>>(data);
}

bool huffpack::files::writeFile(
    std::string const &path,
    std::vector<uint8_t> const &data
) {
    fs::path target(path);
    std::error_code errorCode;
    if (target.has_parent_path())
    {
        fs::create_directories(target.parent_path(), errorCode);
        if (errorCode) return false;
    }

    std::ofstream outFile(target, std::ios::binary);
    if (!outFile)
    {
        return false;
    }

    outFile.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    return outFile.good();
}

std::string huffpack::files::fileExtension(std::string const &path)
{
    return fs::path(path).extension().string();
}

std::string huffpack::files::compressedOutputPath(std::string const &inputPath)
{
    fs::path input(inputPath);
    std::string name = input.stem().string() + CompressedSuffix + input.extension().string();
    return (input.parent_path() / name).string();
}

std::string huffpack::files::decompressedOutputPath(
    std::string const &inputPath,
    std::string const &extension
) {
    fs::path input(inputPath);
    std::string stem = input.stem().string();
    if (stem.size() >= CompressedSuffix.size()
        && stem.compare(stem.size() - CompressedSuffix.size(), CompressedSuffix.size(), CompressedSuffix) == 0)
    {
        stem.erase(stem.size() - CompressedSuffix.size());
    }

    std::string suffix = extension.empty() ? input.extension().string() : extension;
    return (input.parent_path() / (stem + DecompressedSuffix + suffix)).string();
}
