#include <benchmark/benchmark.h>

#include <cstdint>
#include <random>
#include <span>
#include <vector>

#include "partpipe/codec/codec.hpp"
#include "partpipe/stream/parallel_compressor.hpp"

using namespace partpipe;

namespace {

class NullSink final : public stream::ByteSink {
public:
    auto write(std::span<const std::uint8_t> bytes) -> std::expected<void, core::error> override {
        bytes_ += bytes.size();
        return {};
    }
    auto close() -> std::expected<void, core::error> override { return {}; }
    std::uint64_t bytes_{0};
};

std::vector<std::uint8_t> make_input(std::size_t n) {
    std::vector<std::uint8_t> v(n);
    std::mt19937 rng(7);
    std::uniform_int_distribution<int> sym(0, 15);
    for (auto& b : v) b = static_cast<std::uint8_t>('a' + sym(rng));
    return v;
}

} // namespace

// Single-frame cost, the unit of work each pool thread performs
static void BM_CompressFrameGzip(benchmark::State& state) {
    const auto raw = make_input(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto f = codec::compress_frame(codec::codec_kind::gzip, 1, raw);
        benchmark::DoNotOptimize(f);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(raw.size()));
}

// End-to-end throughput of the ordered compressor by worker count
static void BM_OrderedParallelCompressor(benchmark::State& state) {
    const auto input = make_input(32u * 1024u * 1024u);
    for (auto _ : state) {
        NullSink sink;
        stream::CompressorOptions o{};
        o.workers = static_cast<std::size_t>(state.range(0));
        o.chunk_bytes = 2u * 1024u * 1024u;
        auto c = stream::OrderedParallelCompressor::create(sink, o);
        if (!c) { state.SkipWithError("compressor creation failed"); return; }
        for (std::size_t off = 0; off < input.size(); off += 256u * 1024u) {
            auto r = (*c)->write(std::span<const std::uint8_t>(input.data() + off, 256u * 1024u));
            if (!r) { state.SkipWithError("write failed"); return; }
        }
        if (!(*c)->close()) { state.SkipWithError("close failed"); return; }
        benchmark::DoNotOptimize(sink.bytes_);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(input.size()));
}

BENCHMARK(BM_CompressFrameGzip)->Arg(64 << 10)->Arg(2 << 20);
BENCHMARK(BM_OrderedParallelCompressor)->Arg(1)->Arg(2)->Arg(4)->Arg(8)->UseRealTime()->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
