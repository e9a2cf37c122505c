#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "config.hpp"

namespace benchmark
{
    namespace utilities
    {
        enum class InputKind : int64_t {
            TEXT,
            SKEWED,
            SINGLE_SYMBOL,
            BINARY
        };

        std::string InputKindName(InputKind kind);

        std::vector<uint8_t> GenerateInput(InputKind kind, size_t size);
    }
}
