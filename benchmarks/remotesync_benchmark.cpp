// remotesync-cpp benchmarks: measures throughput of the codecs, the
// shuffler and complete transfer sessions.

#include <remotesync-cpp/remotesync.hpp>

#include "src/encoding/leb128.hpp"

#include <benchmark/benchmark.h>

#include <algorithm>
#include <cstdint>
#include <random>
#include <vector>

using namespace remotesync_cpp;

static auto random_bytes(std::size_t n, std::uint64_t seed) -> std::vector<std::byte> {
    auto rng = std::mt19937_64{seed};
    auto v = std::vector<std::byte>(n);
    for (auto& b : v) b = static_cast<std::byte>(rng());
    return v;
}

// =============================================================================
// Varint codec
// =============================================================================

static void bm_uleb128_encode(benchmark::State& state) {
    auto out = std::vector<std::byte>{};
    out.reserve(10 * 1024);
    for (auto _ : state) {
        out.clear();
        for (std::uint64_t v = 0; v < 1024; ++v) {
            encoding::encode_uleb128(v * 7919, out);
        }
        benchmark::DoNotOptimize(out.data());
    }
    state.SetItemsProcessed(state.iterations() * 1024);
}
BENCHMARK(bm_uleb128_encode);

static void bm_uleb128_read_stream(benchmark::State& state) {
    auto out = MemoryWriter{};
    for (std::uint64_t v = 0; v < 1024; ++v) encoding::write_uleb128(out, v * 7919);
    for (auto _ : state) {
        auto in = MemoryReader{out.data()};
        auto sum = std::uint64_t{0};
        while (auto v = encoding::read_uleb128_or_end(in)) sum += *v;
        benchmark::DoNotOptimize(sum);
    }
    state.SetItemsProcessed(state.iterations() * 1024);
}
BENCHMARK(bm_uleb128_read_stream);

// =============================================================================
// Shuffler
// =============================================================================

static void bm_shuffler_random(benchmark::State& state) {
    const auto slots = static_cast<std::size_t>(state.range(0));
    auto perm = RandomPermutation{1, slots};
    for (auto _ : state) {
        auto emitted = std::uint64_t{0};
        auto shuffler = StreamShuffler<std::uint64_t>{perm, 0, [&](const std::uint64_t& v) { emitted += v; }};
        for (std::uint64_t i = 0; i < slots / 2; ++i) shuffler.put(i + 1);
        shuffler.end();
        benchmark::DoNotOptimize(emitted);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * slots));
}
BENCHMARK(bm_shuffler_random)->Range(64, 1 << 16);

static void bm_permutation_create(benchmark::State& state) {
    const auto slots = static_cast<std::size_t>(state.range(0));
    std::uint64_t seed = 0;
    for (auto _ : state) {
        auto perm = RandomPermutation{seed++, slots};
        benchmark::DoNotOptimize(perm.forward(0));
    }
}
BENCHMARK(bm_permutation_create)->Range(64, 1 << 16);

// =============================================================================
// Sessions
// =============================================================================

// Transfers a 4 MiB file of which `overlap` percent already exists at the
// receiver.
static void bm_session(benchmark::State& state) {
    const auto overlap = static_cast<std::size_t>(state.range(0));
    const auto size = std::size_t{4} << 20;
    const auto block = std::size_t{64} << 10;

    auto store_a = RamStorage{64 << 20};
    auto bytes = random_bytes(size, 42);
    auto temp = store_a.create("source");
    temp->write(bytes);
    temp->close();
    auto source = temp->file();

    // Receiver base: every block either shared with the source or fresh.
    auto base = std::vector<std::byte>{};
    auto fresh = random_bytes(size, 43);
    for (std::size_t off = 0; off < size; off += block) {
        const auto& from = (off / block) % 100 < overlap ? bytes : fresh;
        base.insert(base.end(), from.begin() + static_cast<std::ptrdiff_t>(off),
                    from.begin() + static_cast<std::ptrdiff_t>(off + block));
    }

    auto config = SyncConfig{.slot_count = 2048};
    for (auto _ : state) {
        state.PauseTiming();
        auto store_b = RamStorage{64 << 20};
        auto base_temp = store_b.create("base");
        base_temp->write(base);
        base_temp->close();
        auto base_file = base_temp->file();
        state.ResumeTiming();

        auto file = transfer_file(store_a, source, store_b, config, "copy");
        benchmark::DoNotOptimize(file->key());
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * size));
}
BENCHMARK(bm_session)->Arg(0)->Arg(50)->Arg(90)->Arg(100)->UseRealTime();
