/// @file types.hpp
/// @brief Core identity types: SKey, the placeholder key, TransferStatusCallback.

#pragma once

#include <algorithm>
#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace remotesync_cpp {

/// A 32-byte SHA-256 content hash identifying a chunk or a file.
///
/// Storage is content-addressed: two chunks with equal keys hold identical
/// bytes and are never transferred twice. The all-zero key is reserved as
/// the placeholder that pads a shuffled hash list to its slot count.
struct SKey {
    static constexpr std::size_t size = 32;  ///< Fixed size in bytes.
    std::array<std::byte, size> bytes{};     ///< Raw hash bytes.

    constexpr SKey() = default;

    /// Construct from a byte array.
    explicit constexpr SKey(std::array<std::byte, size> b) : bytes{b} {}

    /// Construct from a raw uint8_t array (convenience for tests).
    explicit SKey(const std::uint8_t (&raw)[size]) {
        std::ranges::transform(raw, bytes.begin(),
            [](std::uint8_t b) { return std::byte{b}; });
    }

    auto operator<=>(const SKey&) const = default;
    auto operator==(const SKey&) const -> bool = default;

    /// Check if all bytes are zero.
    auto is_zero() const -> bool {
        return std::ranges::all_of(bytes, [](std::byte b) {
            return b == std::byte{0};
        });
    }

    /// Lowercase hex rendering of all 32 bytes.
    auto to_hex() const -> std::string;

    /// Short hex prefix for log output.
    auto short_hex() const -> std::string { return to_hex().substr(0, 12); }

    /// Parse a 64-character hex string.
    /// @return The key, or nullopt if the string is not valid hex of the right length.
    static auto from_hex(std::string_view hex) -> std::optional<SKey>;
};

/// The placeholder key: never stored, never requested.
inline constexpr auto empty_key = SKey{};

/// Progress snapshot of the chunk-data phase.
///
/// bytes_to_transfer starts at the file size and shrinks whenever a chunk
/// turns out not to be requested; bytes_transferred only grows.
struct TransferStatus {
    std::uint64_t bytes_to_transfer = 0;
    std::uint64_t bytes_transferred = 0;
    std::uint64_t chunks_transferred = 0;

    auto operator==(const TransferStatus&) const -> bool = default;
};

/// Progress observer for the chunk-data phase.
///
/// Called inline on the sending stage with (bytes_to_transfer, bytes_transferred).
using TransferStatusCallback =
    std::function<void(std::uint64_t bytes_to_transfer, std::uint64_t bytes_transferred)>;

}  // namespace remotesync_cpp

// -- std::hash specializations ------------------------------------------------

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<remotesync_cpp::SKey> {
    auto operator()(const remotesync_cpp::SKey& key) const noexcept -> std::size_t {
        // First 8 bytes of the SHA-256 hash are already well-distributed
        auto result = std::size_t{0};
        const auto* p = reinterpret_cast<const unsigned char*>(key.bytes.data());
        for (std::size_t i = 0; i < sizeof(std::size_t); ++i) {
            result = (result << 8) | p[i];
        }
        return result;
    }
};

/// @endcond
