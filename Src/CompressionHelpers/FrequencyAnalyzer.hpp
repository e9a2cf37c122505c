#pragma once
#ifndef HUFFPACK_FREQUENCY_ANALYZER_HPP
#define HUFFPACK_FREQUENCY_ANALYZER_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace huffpack::algorithms
{
    constexpr size_t SYMBOL_COUNT = 256;

    struct FrequencyTable
    {
        std::array<uint64_t, SYMBOL_COUNT> counts{};

        uint64_t countOf(uint8_t symbol) const
        {
            return counts[symbol];
        }

        size_t distinctSymbols() const;
        uint64_t totalCount() const;
        bool empty() const { return distinctSymbols() == 0; }
    };

    struct FrequencyAnalyzer
    {
        // Throws EmptyInputError for a zero-length buffer.
        static FrequencyTable analyze(const std::vector<uint8_t>& input);
    };
}

#endif // HUFFPACK_FREQUENCY_ANALYZER_HPP
