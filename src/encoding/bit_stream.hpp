#pragma once

// Packed bit stream for the wishlist.
//
// Encoding: one bit per slot, most significant bit first within each byte.
// The final byte is padded with zero bits; nothing follows it.
//
// Internal header, not installed.

#include <remotesync-cpp/error.hpp>
#include <remotesync-cpp/io.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace remotesync_cpp::encoding {

// -- Bit Writer ---------------------------------------------------------------

class BitWriter {
public:
    explicit BitWriter(ByteWriter& out) : out_{out} {}

    void write_bit(bool bit) {
        current_ = static_cast<std::uint8_t>((current_ << 1) | (bit ? 1u : 0u));
        ++used_;
        ++bits_written_;
        if (used_ == 8) {
            out_.write_byte(static_cast<std::byte>(current_));
            current_ = 0;
            used_ = 0;
        }
    }

    // Emit the partial byte (zero padded) and flush the underlying writer.
    void finish() {
        if (used_ > 0) {
            out_.write_byte(static_cast<std::byte>(current_ << (8 - used_)));
            current_ = 0;
            used_ = 0;
        }
        out_.flush();
    }

    auto bits_written() const -> std::uint64_t { return bits_written_; }

private:
    ByteWriter& out_;
    std::uint8_t current_ = 0;
    unsigned used_ = 0;
    std::uint64_t bits_written_ = 0;
};

// -- Bit Reader ---------------------------------------------------------------

class BitReader {
public:
    explicit BitReader(ByteReader& in) : in_{in} {}

    // Throws SyncError{wishlist_too_short} when the stream has no more bytes.
    auto read_bit() -> bool {
        if (available_ == 0) {
            auto b = in_.read_byte();
            if (!b) {
                throw SyncError{ErrorKind::wishlist_too_short,
                                "wishlist ended after " + std::to_string(bits_read_) + " bits"};
            }
            current_ = static_cast<std::uint8_t>(*b);
            available_ = 8;
        }
        --available_;
        ++bits_read_;
        return ((current_ >> available_) & 1u) != 0;
    }

    // The stream must be exhausted once every expected bit has been read.
    // Throws SyncError{wishlist_too_long} otherwise.
    void expect_end() {
        if (in_.read_byte()) {
            throw SyncError{ErrorKind::wishlist_too_long,
                            "wishlist has trailing bytes after " + std::to_string(bits_read_) + " bits"};
        }
    }

    auto bits_read() const -> std::uint64_t { return bits_read_; }

private:
    ByteReader& in_;
    std::uint8_t current_ = 0;
    unsigned available_ = 0;
    std::uint64_t bits_read_ = 0;
};

}  // namespace remotesync_cpp::encoding
