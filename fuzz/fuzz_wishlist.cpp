// Fuzz target for the sender's wishlist parser: arbitrary bytes as the
// wishlist for a fixed small file. Only SyncError may escape.

#include <remotesync-cpp/remotesync.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace rs = remotesync_cpp;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    static auto store = rs::RamStorage{1 << 20, rs::ChunkingParams::fixed(64)};
    static auto file = [] {
        auto bytes = std::vector<std::byte>(5 * 64 - 10);
        for (std::size_t i = 0; i < bytes.size(); ++i) bytes[i] = static_cast<std::byte>(i * 13);
        auto temp = store.create("fuzz");
        temp->write(bytes);
        temp->close();
        return temp->file();
    }();
    static auto perm = rs::RandomPermutation{7, 16};

    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);
    auto in = rs::MemoryReader{span};
    auto out = rs::MemoryWriter{};
    try {
        auto status = rs::write_chunk_data(store, *file, in, perm, out);
        if (status.bytes_transferred > status.bytes_to_transfer) __builtin_trap();
    } catch (const rs::SyncError&) {
        // rejected input
    }
    return 0;
}
