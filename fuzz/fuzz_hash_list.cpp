// Fuzz target for the receiver's hash-list parser and reconstruction.
// The input is split at its first byte: the rest up to that offset is the
// hash list, the remainder the chunk data. Only SyncError may escape.

#include <remotesync-cpp/remotesync.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>

namespace rs = remotesync_cpp;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size == 0) return 0;
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size).subspan(1);
    const auto split = std::min<std::size_t>(span.size(), static_cast<std::size_t>(data[0]) * 4);

    auto store = rs::RamStorage{1 << 20};
    auto perm = rs::RandomPermutation{3, 4};
    auto builder = rs::Builder{store, perm, 2, "fuzz"};

    auto hashes = rs::MemoryReader{span.first(split)};
    auto wishlist = rs::MemoryWriter{};
    try {
        builder.write_wishlist(hashes, wishlist);
    } catch (const rs::SyncError&) {
        return 0;
    }
    if (wishlist.data().size() != 1) __builtin_trap();

    auto chunk_data = rs::MemoryReader{span.subspan(split)};
    try {
        auto file = builder.reconstruct_file(chunk_data);
        if (file->size() != builder.expected_size()) __builtin_trap();
    } catch (const rs::SyncError&) {
        // rejected input
    }
    return 0;
}
