#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "Result.hpp"

namespace huffpack::files
{
    const std::string CompressedSuffix = "_compressed";
    const std::string DecompressedSuffix = "_decompressed";

    Result<std::vector<uint8_t>> readFile(std::string const &path);

    bool writeFile(
        std::string const &path,
        std::vector<uint8_t> const &data
    );

    // ".txt" for "notes.txt", "" when there is none
    std::string fileExtension(std::string const &path);

    // <parent>/<stem>_compressed<suffix>
    std::string compressedOutputPath(std::string const &inputPath);

    // Drops a trailing "_compressed" from the stem, then appends "_decompressed"
    // and the given extension (the input's own suffix when empty).
    std::string decompressedOutputPath(
        std::string const &inputPath,
        std::string const &extension = ""
    );
}
