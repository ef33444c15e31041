/// @file io.hpp
/// @brief Byte channel interfaces and the in-process readers/writers built on them.
///
/// Every protocol phase reads from a ByteReader and writes to a ByteWriter.
/// Implementations report failures by throwing (SyncError for channel
/// failures, or whatever exception a peer stage closed the channel with).

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace remotesync_cpp {

/// A source of bytes.
class ByteReader {
public:
    virtual ~ByteReader() = default;

    /// Read up to buffer.size() bytes. Blocks until at least one byte is
    /// available. Returns 0 only at end of stream (or for an empty buffer).
    virtual auto read(std::span<std::byte> buffer) -> std::size_t = 0;

    /// Read a single byte; nullopt at end of stream.
    virtual auto read_byte() -> std::optional<std::byte>;

    /// Read until buffer is full or the stream ends. Returns bytes read.
    auto read_full(std::span<std::byte> buffer) -> std::size_t;
};

/// A sink for bytes.
class ByteWriter {
public:
    virtual ~ByteWriter() = default;

    /// Write every byte of data or throw.
    virtual void write(std::span<const std::byte> data) = 0;

    /// Push buffered bytes downstream. No-op for unbuffered writers.
    virtual void flush() {}

    void write_byte(std::byte b) { write(std::span<const std::byte>{&b, 1}); }
};

/// Copy every remaining byte of src into dst. Returns the number copied.
auto copy_stream(ByteReader& src, ByteWriter& dst) -> std::uint64_t;

// -- In-memory endpoints ------------------------------------------------------

/// Reads from a caller-owned span.
class MemoryReader : public ByteReader {
public:
    explicit MemoryReader(std::span<const std::byte> data) : data_{data} {}

    auto read(std::span<std::byte> buffer) -> std::size_t override;
    auto read_byte() -> std::optional<std::byte> override;

    auto remaining() const -> std::size_t { return data_.size() - pos_; }

private:
    std::span<const std::byte> data_;
    std::size_t pos_ = 0;
};

/// Appends to an owned vector.
class MemoryWriter : public ByteWriter {
public:
    void write(std::span<const std::byte> data) override {
        data_.insert(data_.end(), data.begin(), data.end());
    }

    auto data() const -> const std::vector<std::byte>& { return data_; }
    auto take() -> std::vector<std::byte> { return std::move(data_); }

private:
    std::vector<std::byte> data_;
};

// -- Adaptors -----------------------------------------------------------------

/// Exposes at most `limit` bytes of another reader.
class LimitedReader : public ByteReader {
public:
    LimitedReader(ByteReader& inner, std::uint64_t limit)
        : inner_{inner}, remaining_{limit} {}

    auto read(std::span<std::byte> buffer) -> std::size_t override;

    auto remaining() const -> std::uint64_t { return remaining_; }

private:
    ByteReader& inner_;
    std::uint64_t remaining_;
};

/// Batches small reads from another reader.
class BufferedReader : public ByteReader {
public:
    static constexpr std::size_t default_capacity = 4096;

    explicit BufferedReader(ByteReader& inner, std::size_t capacity = default_capacity)
        : inner_{inner}, buffer_(capacity) {}

    auto read(std::span<std::byte> buffer) -> std::size_t override;
    auto read_byte() -> std::optional<std::byte> override;

private:
    auto fill() -> bool;

    ByteReader& inner_;
    std::vector<std::byte> buffer_;
    std::size_t begin_ = 0;
    std::size_t end_ = 0;
};

/// Batches small writes to another writer. flush() forwards the flush.
///
/// The destructor does not flush: a stage that fails must not push a
/// half-written frame downstream.
class BufferedWriter : public ByteWriter {
public:
    static constexpr std::size_t default_capacity = 4096;

    explicit BufferedWriter(ByteWriter& inner, std::size_t capacity = default_capacity)
        : inner_{inner}, capacity_{capacity} {
        buffer_.reserve(capacity);
    }

    void write(std::span<const std::byte> data) override;
    void flush() override;

private:
    ByteWriter& inner_;
    std::size_t capacity_;
    std::vector<std::byte> buffer_;
};

}  // namespace remotesync_cpp
