#include "utilities.hpp"
#include "config.hpp"
#include <random>

std::string benchmark::utilities::InputKindName(InputKind kind)
{
    switch (kind)
    {
        case InputKind::TEXT:          return "text";
        case InputKind::SKEWED:        return "skewed";
        case InputKind::SINGLE_SYMBOL: return "singleSymbol";
        case InputKind::BINARY:        return "binary";
    }
    return "unknown";
}

std::vector<uint8_t> benchmark::utilities::GenerateInput(
    InputKind kind,
    size_t size
) {
    std::vector<uint8_t> input;
    input.reserve(size);
    std::mt19937 generator(RandomSeed);

    switch (kind)
    {
        case InputKind::TEXT:
        {
            std::uniform_int_distribution<size_t> pick(0, TextAlphabet.size() - 1);
            for (size_t i = 0; i < size; ++i)
                input.push_back(static_cast<uint8_t>(TextAlphabet[pick(generator)]));
            break;
        }
        case InputKind::SKEWED:
        {
            // roughly geometric symbol distribution
            std::geometric_distribution<int> pick(0.3);
            for (size_t i = 0; i < size; ++i)
                input.push_back(static_cast<uint8_t>('a' + pick(generator) % 26));
            break;
        }
        case InputKind::SINGLE_SYMBOL:
            input.assign(size, 0x41);
            break;
        case InputKind::BINARY:
        {
            std::uniform_int_distribution<int> pick(0, 255);
            for (size_t i = 0; i < size; ++i)
                input.push_back(static_cast<uint8_t>(pick(generator)));
            break;
        }
    }
    return input;
}
