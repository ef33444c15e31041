// sync_demo: transferring a file between two in-memory stores
//
// Demonstrates: RamStorage, transfer_file, run_session, progress reporting,
//               SyncConfig from JSON

#include <remotesync-cpp/remotesync.hpp>

#include <cstdint>
#include <cstdio>
#include <memory>
#include <random>
#include <vector>

namespace rs = remotesync_cpp;

static auto random_bytes(std::size_t size, std::uint64_t seed) -> std::vector<std::byte> {
    auto rng = std::mt19937_64{seed};
    auto bytes = std::vector<std::byte>(size);
    for (auto& b : bytes) b = static_cast<std::byte>(rng());
    return bytes;
}

static auto store_file(rs::FileStorage& storage, const std::vector<std::byte>& bytes)
    -> std::shared_ptr<rs::File> {
    auto temp = storage.create("demo");
    temp->write(bytes);
    temp->close();
    return temp->file();
}

int main() {
    auto config = rs::config_from_json({{"slot_count", 4096}, {"seed", 42}, {"concurrency", 4}});

    auto sender = rs::RamStorage{64 << 20};
    auto receiver = rs::RamStorage{64 << 20};

    // --- Scenario 1: receiver has nothing ---
    std::printf("=== Scenario 1: full transfer ===\n");

    auto original = random_bytes(4 << 20, 1);
    auto source = store_file(sender, original);
    std::printf("Source: %llu bytes in %llu chunks\n",
                static_cast<unsigned long long>(source->size()),
                static_cast<unsigned long long>(source->num_chunks()));

    auto options = rs::SessionOptions{};
    std::uint64_t last_percent = 0;
    options.on_status = [&](std::uint64_t total, std::uint64_t done) {
        auto percent = total == 0 ? 100 : done * 100 / total;
        if (percent >= last_percent + 25) {
            std::printf("  sent %llu%%\n", static_cast<unsigned long long>(percent));
            last_percent = percent;
        }
    };

    auto copy = rs::transfer_file(sender, source, receiver, config, "scenario-1", options);
    std::printf("Receiver file %s, %llu bytes, keys match: %s\n",
                copy->key().short_hex().c_str(),
                static_cast<unsigned long long>(copy->size()),
                copy->key() == source->key() ? "yes" : "no");

    // --- Scenario 2: a small edit in the middle ---
    std::printf("\n=== Scenario 2: delta transfer ===\n");

    auto edited = original;
    for (std::size_t i = 0; i < 100; ++i) edited[2'000'000 + i] = std::byte{0};
    auto edited_source = store_file(sender, edited);

    auto perm = rs::make_permutation(config);
    auto builder = rs::Builder{receiver, *perm, config.concurrency, "scenario-2"};
    options.on_status = nullptr;
    auto edited_copy = rs::run_session(sender, edited_source, builder, *perm, options);

    std::printf("Advertised %zu chunks, requested %zu (%llu of %llu bytes)\n",
                builder.advertised_chunks(), builder.requested_chunks(),
                static_cast<unsigned long long>(builder.requested_bytes()),
                static_cast<unsigned long long>(builder.expected_size()));
    std::printf("Keys match: %s\n", edited_copy->key() == edited_source->key() ? "yes" : "no");

    // --- Scenario 3: a permutation too small for the file ---
    std::printf("\n=== Scenario 3: slot count too small ===\n");

    auto tight = config;
    tight.slot_count = 4;
    try {
        rs::transfer_file(sender, source, receiver, tight, "scenario-3", options);
    } catch (const rs::SyncError& e) {
        std::printf("Transfer failed as expected: %s\n", e.what());
    }

    return 0;
}
