#include <remotesync-cpp/pipe.hpp>

#include <remotesync-cpp/error.hpp>

#include <algorithm>
#include <cstring>

namespace remotesync_cpp {

auto Pipe::Reader::read(std::span<std::byte> buffer) -> std::size_t {
    return pipe_.do_read(buffer);
}

void Pipe::Writer::write(std::span<const std::byte> data) {
    pipe_.do_write(data);
}

auto Pipe::do_read(std::span<std::byte> buffer) -> std::size_t {
    if (buffer.empty()) return 0;

    auto lock = std::unique_lock{mutex_};
    cv_.wait(lock, [&] {
        return !pending_.empty() || write_closed_ || read_closed_;
    });

    if (read_closed_) {
        throw SyncError{ErrorKind::io_error, "read on closed pipe"};
    }
    if (!pending_.empty()) {
        auto n = std::min(buffer.size(), pending_.size());
        std::memcpy(buffer.data(), pending_.data(), n);
        pending_ = pending_.subspan(n);
        if (pending_.empty()) cv_.notify_all();
        return n;
    }
    if (write_error_) std::rethrow_exception(write_error_);
    return 0;
}

void Pipe::do_write(std::span<const std::byte> data) {
    auto lock = std::unique_lock{mutex_};

    auto check_open = [&] {
        if (read_closed_) {
            if (read_error_) std::rethrow_exception(read_error_);
            throw SyncError{ErrorKind::io_error, "write on pipe closed by reader"};
        }
        if (write_closed_) {
            throw SyncError{ErrorKind::io_error, "write on closed pipe"};
        }
    };

    check_open();
    if (data.empty()) return;

    pending_ = data;
    cv_.notify_all();
    cv_.wait(lock, [&] { return pending_.empty() || read_closed_; });

    if (!pending_.empty()) {
        pending_ = {};
        check_open();
    }
}

void Pipe::close_write(std::exception_ptr error) {
    {
        auto lock = std::scoped_lock{mutex_};
        if (write_closed_) return;
        write_closed_ = true;
        write_error_ = std::move(error);
    }
    cv_.notify_all();
}

void Pipe::close_read(std::exception_ptr error) {
    {
        auto lock = std::scoped_lock{mutex_};
        if (read_closed_) return;
        read_closed_ = true;
        read_error_ = std::move(error);
    }
    cv_.notify_all();
}

}  // namespace remotesync_cpp
