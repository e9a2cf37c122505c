#pragma once
#include <cstdint>
#include <string>
#include <vector>

const int IterationTimes = 5;

const unsigned RandomSeed = 42;

const std::string TextAlphabet = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789 .,";

const std::string InputExtension = ".txt";

const std::vector<int64_t> InputSizes = {
    1 << 10,    // 1 KB
    1 << 16,    // 64 KB
    1 << 20,    // 1 MB
    1 << 24     // 16 MB
};
