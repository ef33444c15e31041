#pragma once

// LEB128 (Little Endian Base 128) variable-length integer encoding.
// Carries chunk sizes in the hash-list and chunk-data streams.
// Internal header, not installed.

#include <remotesync-cpp/error.hpp>
#include <remotesync-cpp/io.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace remotesync_cpp::encoding {

// A uint64 never needs more than ceil(64/7) bytes.
inline constexpr std::size_t max_uleb128_size = 10;

// -- Buffers ------------------------------------------------------------------

// Encode a uint64 as unsigned LEB128 into a fixed buffer. Returns the length.
inline auto encode_uleb128(std::uint64_t value, std::span<std::byte, max_uleb128_size> out)
    -> std::size_t {
    auto n = std::size_t{0};
    do {
        auto byte = static_cast<std::byte>(value & 0x7F);
        value >>= 7;
        if (value != 0) {
            byte |= std::byte{0x80};  // more bytes follow
        }
        out[n++] = byte;
    } while (value != 0);
    return n;
}

// Encode a uint64 as unsigned LEB128, appending bytes to output.
inline void encode_uleb128(std::uint64_t value, std::vector<std::byte>& output) {
    auto buf = std::array<std::byte, max_uleb128_size>{};
    auto n = encode_uleb128(value, buf);
    output.insert(output.end(), buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(n));
}

// Encode a uint64 as unsigned LEB128, returning the bytes.
inline auto encode_uleb128(std::uint64_t value) -> std::vector<std::byte> {
    auto result = std::vector<std::byte>{};
    encode_uleb128(value, result);
    return result;
}

// Result of a decode operation: decoded value + number of bytes consumed.
struct DecodeResult {
    std::uint64_t value;
    std::size_t bytes_read;
};

// Decode an unsigned LEB128 value from a byte span.
// Returns nullopt if the input is truncated (no terminating byte found)
// or the encoding does not fit in 64 bits.
inline auto decode_uleb128(std::span<const std::byte> input) -> std::optional<DecodeResult> {
    auto value = std::uint64_t{0};
    auto shift = 0u;

    for (std::size_t i = 0; i < input.size(); ++i) {
        if (i == max_uleb128_size) return std::nullopt;  // overflow

        auto byte = input[i];
        auto payload = static_cast<std::uint64_t>(byte) & 0x7F;
        if (shift == 63 && payload > 1) return std::nullopt;  // bits past 63
        value |= payload << shift;
        shift += 7;

        if ((byte & std::byte{0x80}) == std::byte{0}) {
            return DecodeResult{.value = value, .bytes_read = i + 1};
        }
    }

    return std::nullopt;  // truncated input
}

// -- Streams ------------------------------------------------------------------

inline void write_uleb128(ByteWriter& out, std::uint64_t value) {
    auto buf = std::array<std::byte, max_uleb128_size>{};
    auto n = encode_uleb128(value, buf);
    out.write(std::span<const std::byte>{buf.data(), n});
}

// Read one unsigned LEB128 value from a stream, or nullopt if the stream is
// already at its end. Throws SyncError{malformed_varint} if it ends midway
// or the value overflows.
inline auto read_uleb128_or_end(ByteReader& in) -> std::optional<std::uint64_t> {
    auto value = std::uint64_t{0};
    auto shift = 0u;

    for (std::size_t i = 0; i < max_uleb128_size; ++i) {
        auto b = in.read_byte();
        if (!b) {
            if (i == 0) return std::nullopt;
            throw SyncError{ErrorKind::malformed_varint, "stream ended inside varint"};
        }
        auto payload = static_cast<std::uint64_t>(*b) & 0x7F;
        if (shift == 63 && payload > 1) {
            throw SyncError{ErrorKind::malformed_varint, "varint overflows 64 bits"};
        }
        value |= payload << shift;
        shift += 7;

        if ((*b & std::byte{0x80}) == std::byte{0}) return value;
    }

    throw SyncError{ErrorKind::malformed_varint, "varint longer than 10 bytes"};
}

// Read one unsigned LEB128 value from a stream.
// Throws SyncError{malformed_varint} on end of stream, truncation or overflow.
inline auto read_uleb128(ByteReader& in) -> std::uint64_t {
    auto value = read_uleb128_or_end(in);
    if (!value) {
        throw SyncError{ErrorKind::malformed_varint, "stream ended before varint"};
    }
    return *value;
}

}  // namespace remotesync_cpp::encoding
