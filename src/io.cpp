#include <remotesync-cpp/io.hpp>

#include <algorithm>
#include <array>
#include <cstring>

namespace remotesync_cpp {

// -- ByteReader ---------------------------------------------------------------

auto ByteReader::read_byte() -> std::optional<std::byte> {
    auto b = std::byte{};
    if (read(std::span<std::byte>{&b, 1}) == 0) return std::nullopt;
    return b;
}

auto ByteReader::read_full(std::span<std::byte> buffer) -> std::size_t {
    auto total = std::size_t{0};
    while (total < buffer.size()) {
        auto n = read(buffer.subspan(total));
        if (n == 0) break;
        total += n;
    }
    return total;
}

auto copy_stream(ByteReader& src, ByteWriter& dst) -> std::uint64_t {
    auto buffer = std::array<std::byte, 8192>{};
    auto total = std::uint64_t{0};
    while (true) {
        auto n = src.read(buffer);
        if (n == 0) break;
        dst.write(std::span<const std::byte>{buffer.data(), n});
        total += n;
    }
    return total;
}

// -- MemoryReader -------------------------------------------------------------

auto MemoryReader::read(std::span<std::byte> buffer) -> std::size_t {
    auto n = std::min(buffer.size(), remaining());
    if (n > 0) {
        std::memcpy(buffer.data(), data_.data() + pos_, n);
        pos_ += n;
    }
    return n;
}

auto MemoryReader::read_byte() -> std::optional<std::byte> {
    if (pos_ >= data_.size()) return std::nullopt;
    return data_[pos_++];
}

// -- LimitedReader ------------------------------------------------------------

auto LimitedReader::read(std::span<std::byte> buffer) -> std::size_t {
    if (remaining_ == 0) return 0;
    if (buffer.size() > remaining_) {
        buffer = buffer.first(static_cast<std::size_t>(remaining_));
    }
    auto n = inner_.read(buffer);
    remaining_ -= n;
    return n;
}

// -- BufferedReader -----------------------------------------------------------

auto BufferedReader::fill() -> bool {
    begin_ = 0;
    end_ = inner_.read(buffer_);
    return end_ > 0;
}

auto BufferedReader::read(std::span<std::byte> buffer) -> std::size_t {
    if (buffer.empty()) return 0;
    if (begin_ == end_) {
        // Large reads bypass the buffer
        if (buffer.size() >= buffer_.size()) return inner_.read(buffer);
        if (!fill()) return 0;
    }
    auto n = std::min(buffer.size(), end_ - begin_);
    std::memcpy(buffer.data(), buffer_.data() + begin_, n);
    begin_ += n;
    return n;
}

auto BufferedReader::read_byte() -> std::optional<std::byte> {
    if (begin_ == end_ && !fill()) return std::nullopt;
    return buffer_[begin_++];
}

// -- BufferedWriter -----------------------------------------------------------

void BufferedWriter::write(std::span<const std::byte> data) {
    if (buffer_.size() + data.size() > capacity_) {
        if (!buffer_.empty()) {
            inner_.write(buffer_);
            buffer_.clear();
        }
        if (data.size() >= capacity_) {
            inner_.write(data);
            return;
        }
    }
    buffer_.insert(buffer_.end(), data.begin(), data.end());
}

void BufferedWriter::flush() {
    if (!buffer_.empty()) {
        inner_.write(buffer_);
        buffer_.clear();
    }
    inner_.flush();
}

}  // namespace remotesync_cpp
