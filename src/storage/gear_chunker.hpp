#pragma once

// Content-defined chunking with a gear rolling hash.
//
// h = (h << 1) + gear[byte] over every byte past min_size; a cut point is
// declared when the low bits selected by the mask are all zero, or when the
// chunk reaches max_size. The mask width derives from avg_size. With
// min_size == max_size the chunker degenerates to fixed-size blocks.
//
// Internal header, not installed.

#include <remotesync-cpp/ram_storage.hpp>

#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace remotesync_cpp::storage {

namespace detail {

// splitmix64 finalizer, used only to fill the gear table at compile time.
constexpr auto splitmix64(std::uint64_t& state) -> std::uint64_t {
    auto z = (state += 0x9E3779B97F4A7C15ULL);
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

constexpr auto make_gear_table() -> std::array<std::uint64_t, 256> {
    auto table = std::array<std::uint64_t, 256>{};
    auto state = std::uint64_t{2018};
    for (auto& v : table) v = splitmix64(state);
    return table;
}

inline constexpr auto gear_table = make_gear_table();

}  // namespace detail

class GearChunker {
public:
    explicit GearChunker(ChunkingParams params)
        : params_{params}, mask_{mask_for(params.avg_size)} {}

    // Scan data as the continuation of the current chunk. Returns the offset
    // just past the cut point if the chunk ends inside data, nullopt otherwise.
    // After a cut the chunker starts a new chunk.
    auto find_boundary(std::span<const std::byte> data) -> std::optional<std::size_t> {
        for (std::size_t i = 0; i < data.size(); ++i) {
            ++length_;
            if (length_ >= params_.max_size) {
                reset();
                return i + 1;
            }
            if (length_ <= params_.min_size) continue;
            hash_ = (hash_ << 1) + detail::gear_table[static_cast<std::uint8_t>(data[i])];
            if ((hash_ & mask_) == 0) {
                reset();
                return i + 1;
            }
        }
        return std::nullopt;
    }

    void reset() {
        length_ = 0;
        hash_ = 0;
    }

private:
    static auto mask_for(std::size_t avg_size) -> std::uint64_t {
        auto bits = static_cast<unsigned>(std::bit_width(avg_size));
        bits = bits > 1 ? bits - 1 : 1;
        if (bits > 30) bits = 30;
        return (std::uint64_t{1} << bits) - 1;
    }

    ChunkingParams params_;
    std::uint64_t mask_;
    std::size_t length_ = 0;
    std::uint64_t hash_ = 0;
};

}  // namespace remotesync_cpp::storage
