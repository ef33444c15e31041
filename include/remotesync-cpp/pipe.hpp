/// @file pipe.hpp
/// @brief Synchronous in-process byte pipe connecting two protocol stages.

#pragma once

#include <remotesync-cpp/io.hpp>

#include <condition_variable>
#include <cstddef>
#include <exception>
#include <mutex>
#include <span>

namespace remotesync_cpp {

/// An unbuffered, blocking pipe between exactly one writer thread and one
/// reader thread.
///
/// A write blocks until the reader has consumed every byte of it, so a slow
/// reader stalls its writer and nothing is buffered in between. Either side
/// may close the pipe with an exception; the other side then rethrows that
/// exception from its next (or currently blocked) call. This is how a
/// failing stage aborts its neighbours.
///
/// @code
/// auto pipe = Pipe{};
/// // writer thread
/// try {
///     produce(pipe.writer());
///     pipe.close_write();
/// } catch (...) {
///     pipe.close_write(std::current_exception());
///     throw;
/// }
/// // reader thread
/// consume(pipe.reader());
/// @endcode
class Pipe {
public:
    Pipe() : reader_{*this}, writer_{*this} {}

    Pipe(const Pipe&) = delete;
    auto operator=(const Pipe&) -> Pipe& = delete;
    Pipe(Pipe&&) = delete;
    auto operator=(Pipe&&) -> Pipe& = delete;

    auto reader() -> ByteReader& { return reader_; }
    auto writer() -> ByteWriter& { return writer_; }

    /// Signal end of stream. With an error, the reader rethrows it instead
    /// of seeing end of stream. Only the first close takes effect.
    void close_write(std::exception_ptr error = nullptr);

    /// Stop reading. Blocked and future writes rethrow `error`, or fail with
    /// io_error when no error is given. Only the first close takes effect.
    void close_read(std::exception_ptr error = nullptr);

private:
    class Reader : public ByteReader {
    public:
        explicit Reader(Pipe& pipe) : pipe_{pipe} {}
        auto read(std::span<std::byte> buffer) -> std::size_t override;

    private:
        Pipe& pipe_;
    };

    class Writer : public ByteWriter {
    public:
        explicit Writer(Pipe& pipe) : pipe_{pipe} {}
        void write(std::span<const std::byte> data) override;

    private:
        Pipe& pipe_;
    };

    auto do_read(std::span<std::byte> buffer) -> std::size_t;
    void do_write(std::span<const std::byte> data);

    Reader reader_;
    Writer writer_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::span<const std::byte> pending_;  // bytes offered by the blocked writer
    bool write_closed_ = false;
    bool read_closed_ = false;
    std::exception_ptr write_error_;
    std::exception_ptr read_error_;
};

}  // namespace remotesync_cpp
