/// @file ram_storage.hpp
/// @brief In-memory content-addressable store.

#pragma once

#include <remotesync-cpp/storage.hpp>
#include <remotesync-cpp/types.hpp>

#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace remotesync_cpp {

/// Chunk boundary parameters for RamStorage temporaries.
///
/// Chunks are cut by a gear rolling hash between min_size and max_size
/// bytes, averaging roughly min_size + avg_size. min_size == max_size yields
/// fixed-size chunks.
struct ChunkingParams {
    std::size_t min_size = 2048;
    std::size_t avg_size = 8192;
    std::size_t max_size = 65536;

    /// Fixed-size chunks of exactly `size` bytes (the last one may be shorter).
    static auto fixed(std::size_t size) -> ChunkingParams {
        return ChunkingParams{.min_size = size, .avg_size = size, .max_size = size};
    }
};

struct RamChunk;
struct RamFileData;
class RamTemporary;

/// A bounded in-memory FileStorage.
///
/// Chunks are keyed by the SHA-256 of their bytes and stored once. A chunk
/// stays resident while any File handle references it; unreferenced chunks
/// are evicted least-recently-used first when a new chunk would exceed the
/// capacity. If every resident byte is referenced, writing fails with
/// SyncError{storage_error}.
///
/// A file's key is the SHA-256 of its complete content, so a single-chunk
/// file and its chunk share a key. Thread-safe.
///
/// Temporaries and files must not outlive the storage that created them.
///
/// @code
/// auto store = RamStorage{8 * 1024 * 1024};
/// auto tmp = store.create("example");
/// tmp->write(bytes);
/// tmp->close();
/// auto file = tmp->file();
/// @endcode
class RamStorage : public FileStorage {
public:
    explicit RamStorage(std::uint64_t capacity, ChunkingParams params = {});
    ~RamStorage() override;

    RamStorage(const RamStorage&) = delete;
    auto operator=(const RamStorage&) -> RamStorage& = delete;

    auto create(std::string_view info) -> std::unique_ptr<Temporary> override;
    auto get(const SKey& key) -> std::shared_ptr<File> override;

    /// Number of resident chunks, referenced or not.
    auto chunk_count() const -> std::size_t;

    /// Number of resident chunks not referenced by any handle.
    auto unreferenced_chunk_count() const -> std::size_t;

    /// Bytes held by resident chunks.
    auto used_bytes() const -> std::uint64_t;

    auto capacity() const -> std::uint64_t { return capacity_; }
    auto chunking() const -> const ChunkingParams& { return params_; }

private:
    friend class RamTemporary;

    struct Entry {
        std::shared_ptr<const RamChunk> chunk;
        std::list<SKey>::iterator lru_pos;
    };

    // Store a sealed chunk's bytes, returning the resident (possibly
    // pre-existing) chunk.
    auto insert_chunk(std::vector<std::byte> bytes) -> std::shared_ptr<const RamChunk>;

    // Make a multi-chunk (or empty) file reachable through get().
    void register_file(const std::shared_ptr<const RamFileData>& file);

    void evict_for(std::uint64_t bytes);  // requires mutex_ held

    std::uint64_t capacity_;
    ChunkingParams params_;

    mutable std::mutex mutex_;
    std::uint64_t used_ = 0;
    std::unordered_map<SKey, Entry> chunks_;
    std::list<SKey> lru_;  // front = least recently used
    std::unordered_map<SKey, std::weak_ptr<const RamFileData>> files_;
};

}  // namespace remotesync_cpp
