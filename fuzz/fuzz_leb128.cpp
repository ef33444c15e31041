// Fuzz target for the LEB128 codec: exercises decode edge cases
// (overflow, truncation, maximum-length encodings) on spans and streams.

#include "src/encoding/leb128.hpp"

#include <cstddef>
#include <cstdint>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    auto decoded = remotesync_cpp::encoding::decode_uleb128(span);

    // The stream reader must agree with the span decoder.
    auto in = remotesync_cpp::MemoryReader{span};
    try {
        auto streamed = remotesync_cpp::encoding::read_uleb128_or_end(in);
        if (!decoded || !streamed || decoded->value != *streamed) __builtin_trap();
    } catch (const remotesync_cpp::SyncError&) {
        if (decoded) __builtin_trap();
    }

    if (decoded) {
        auto encoded = remotesync_cpp::encoding::encode_uleb128(decoded->value);
        auto again = remotesync_cpp::encoding::decode_uleb128(encoded);
        if (!again || again->value != decoded->value) __builtin_trap();
    }
    return 0;
}
