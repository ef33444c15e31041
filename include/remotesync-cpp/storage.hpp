/// @file storage.hpp
/// @brief The content-addressable storage boundary consumed by the protocol.
///
/// The protocol never chunks, hashes or stores bytes itself. It reads chunk
/// metadata and chunk bytes of existing files and writes reconstructed
/// content into temporaries, all through these interfaces. Handles release
/// their storage references when destroyed.

#pragma once

#include <remotesync-cpp/io.hpp>
#include <remotesync-cpp/types.hpp>

#include <cstdint>
#include <memory>
#include <string_view>

namespace remotesync_cpp {

class File;

/// Restartable iteration over a file's chunks in storage order.
///
/// Obtain a fresh iterator from File::chunks() to start over.
class ChunkIterator {
public:
    virtual ~ChunkIterator() = default;

    /// Advance to the next chunk. Returns false once the file is exhausted.
    virtual auto next() -> bool = 0;

    /// Key of the current chunk. Only valid after next() returned true.
    virtual auto key() const -> SKey = 0;

    /// Size in bytes of the current chunk.
    virtual auto size() const -> std::uint64_t = 0;

    /// Handle to the current chunk.
    virtual auto chunk() const -> std::shared_ptr<File> = 0;
};

/// An immutable sequence of chunks.
class File {
public:
    virtual ~File() = default;

    /// Key identifying the file's complete content.
    virtual auto key() const -> SKey = 0;

    /// Total size in bytes.
    virtual auto size() const -> std::uint64_t = 0;

    /// True if the file consists of exactly itself, i.e. it is a chunk.
    virtual auto is_chunk() const -> bool = 0;

    virtual auto num_chunks() const -> std::uint64_t = 0;

    virtual auto chunks() const -> std::unique_ptr<ChunkIterator> = 0;

    /// Reader over the file's bytes.
    virtual auto open() const -> std::unique_ptr<ByteReader> = 0;
};

/// A writable blob that becomes an immutable File once closed.
///
/// Destroying a temporary without closing it discards what was written.
class Temporary : public ByteWriter {
public:
    /// Seal the content. No writes are accepted afterwards.
    virtual void close() = 0;

    /// The sealed file. Throws SyncError{invalid_state} before close().
    virtual auto file() -> std::shared_ptr<File> = 0;
};

/// A content-addressable file store.
///
/// Implementations must allow get() and reads of returned files from
/// several threads at once.
class FileStorage {
public:
    virtual ~FileStorage() = default;

    /// Create a temporary. `info` is a human-readable label.
    virtual auto create(std::string_view info) -> std::unique_ptr<Temporary> = 0;

    /// Look up a file or chunk by key. Returns nullptr if absent.
    virtual auto get(const SKey& key) -> std::shared_ptr<File> = 0;
};

}  // namespace remotesync_cpp
