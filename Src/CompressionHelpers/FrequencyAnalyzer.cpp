#include "FrequencyAnalyzer.hpp"
#include "CodecErrors.hpp"

size_t huffpack::algorithms::FrequencyTable::distinctSymbols() const
{
    size_t distinct = 0;
    for (uint64_t count : counts)
    {
        if (count > 0) ++distinct;
    }
    return distinct;
}

uint64_t huffpack::algorithms::FrequencyTable::totalCount() const
{
    uint64_t total = 0;
    for (uint64_t count : counts)
    {
        total += count;
    }
    return total;
}

huffpack::algorithms::FrequencyTable huffpack::algorithms::FrequencyAnalyzer::analyze(
    const std::vector<uint8_t>& input
) {
    if (input.empty())
        throw EmptyInputError(CodecStage::FREQUENCY_ANALYSIS);

    FrequencyTable table;
    for (uint8_t byte : input)
    {
        table.counts[byte]++;
    }
    return table;
}
