#include "utilities.hpp"
#include "config.hpp"
#include "../../Src/CompressionHelpers/Huffman.hpp"
#include <benchmark/benchmark.h>
#include <string>

using benchmark::utilities::InputKind;

static void BM_Compress(benchmark::State& state)
{
    const InputKind kind = static_cast<InputKind>(state.range(0));
    const std::vector<uint8_t> input = benchmark::utilities::GenerateInput(kind, state.range(1));

    size_t compressedSize = 0;
    for (auto _ : state)
    {
        auto compressed = huffpack::algorithms::Huffman::compress(input, InputExtension);
        compressedSize = compressed.container.size();
        benchmark::DoNotOptimize(compressed.container.data());
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(input.size()));
    state.counters["ratio"] = static_cast<double>(input.size()) / static_cast<double>(compressedSize);
}

static void BM_Decompress(benchmark::State& state)
{
    const InputKind kind = static_cast<InputKind>(state.range(0));
    const std::vector<uint8_t> input = benchmark::utilities::GenerateInput(kind, state.range(1));
    const std::vector<uint8_t> container = huffpack::algorithms::Huffman::compress(input, InputExtension).container;

    for (auto _ : state)
    {
        auto decompressed = huffpack::algorithms::Huffman::decompress(container);
        benchmark::DoNotOptimize(decompressed.data.data());
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(input.size()));
}

int main(int argc, char** argv)
{
    benchmark::Initialize(&argc, argv);

    const InputKind kinds[] = {
        InputKind::TEXT,
        InputKind::SKEWED,
        InputKind::SINGLE_SYMBOL,
        InputKind::BINARY
    };

    for (InputKind kind : kinds)
    {
        const std::string name = benchmark::utilities::InputKindName(kind);
        for (int64_t size : InputSizes)
        {
            benchmark::RegisterBenchmark(
                ("BM_Compress/" + name).c_str(),
                &BM_Compress
            )->Args({static_cast<int64_t>(kind), size})->Iterations(IterationTimes);

            benchmark::RegisterBenchmark(
                ("BM_Decompress/" + name).c_str(),
                &BM_Decompress
            )->Args({static_cast<int64_t>(kind), size})->Iterations(IterationTimes);
        }
    }

    benchmark::RunSpecifiedBenchmarks();
    return 0;
}
