#include <remotesync-cpp/ram_storage.hpp>

#include <remotesync-cpp/error.hpp>

#include "crypto/sha256.hpp"
#include "storage/gear_chunker.hpp"

#include <algorithm>
#include <cstring>
#include <string>
#include <utility>

namespace remotesync_cpp {

struct RamChunk {
    SKey key;
    std::vector<std::byte> bytes;
};

struct RamFileData {
    SKey key;
    std::vector<std::shared_ptr<const RamChunk>> chunks;
    std::uint64_t size = 0;
};

namespace {

auto single_chunk_file(std::shared_ptr<const RamChunk> chunk) -> std::shared_ptr<const RamFileData> {
    auto data = std::make_shared<RamFileData>();
    data->key = chunk->key;
    data->size = chunk->bytes.size();
    data->chunks.push_back(std::move(chunk));
    return data;
}

class RamFileReader : public ByteReader {
public:
    explicit RamFileReader(std::shared_ptr<const RamFileData> data)
        : data_{std::move(data)} {}

    auto read(std::span<std::byte> buffer) -> std::size_t override {
        auto total = std::size_t{0};
        while (total < buffer.size() && chunk_ < data_->chunks.size()) {
            const auto& bytes = data_->chunks[chunk_]->bytes;
            auto n = std::min(buffer.size() - total, bytes.size() - offset_);
            std::memcpy(buffer.data() + total, bytes.data() + offset_, n);
            total += n;
            offset_ += n;
            if (offset_ == bytes.size()) {
                ++chunk_;
                offset_ = 0;
            }
        }
        return total;
    }

private:
    std::shared_ptr<const RamFileData> data_;
    std::size_t chunk_ = 0;
    std::size_t offset_ = 0;
};

class RamChunkIterator : public ChunkIterator {
public:
    explicit RamChunkIterator(std::shared_ptr<const RamFileData> data)
        : data_{std::move(data)} {}

    auto next() -> bool override {
        if (pos_ < data_->chunks.size()) {
            ++pos_;
            positioned_ = true;
        } else {
            positioned_ = false;
        }
        return positioned_;
    }

    auto key() const -> SKey override { return current()->key; }
    auto size() const -> std::uint64_t override { return current()->bytes.size(); }
    auto chunk() const -> std::shared_ptr<File> override;

private:
    auto current() const -> const std::shared_ptr<const RamChunk>& {
        if (!positioned_) {
            throw SyncError{ErrorKind::invalid_state, "chunk iterator not positioned on a chunk"};
        }
        return data_->chunks[pos_ - 1];
    }

    std::shared_ptr<const RamFileData> data_;
    std::size_t pos_ = 0;  // one past the current chunk
    bool positioned_ = false;
};

class RamFile : public File {
public:
    explicit RamFile(std::shared_ptr<const RamFileData> data) : data_{std::move(data)} {}

    auto key() const -> SKey override { return data_->key; }
    auto size() const -> std::uint64_t override { return data_->size; }
    auto is_chunk() const -> bool override { return data_->chunks.size() == 1; }
    auto num_chunks() const -> std::uint64_t override { return data_->chunks.size(); }

    auto chunks() const -> std::unique_ptr<ChunkIterator> override {
        return std::make_unique<RamChunkIterator>(data_);
    }

    auto open() const -> std::unique_ptr<ByteReader> override {
        return std::make_unique<RamFileReader>(data_);
    }

private:
    std::shared_ptr<const RamFileData> data_;
};

auto RamChunkIterator::chunk() const -> std::shared_ptr<File> {
    return std::make_shared<RamFile>(single_chunk_file(current()));
}

}  // namespace

// -- RamTemporary -------------------------------------------------------------

class RamTemporary : public Temporary {
public:
    RamTemporary(RamStorage& storage, std::string info)
        : storage_{storage}, info_{std::move(info)}, chunker_{storage.chunking()} {}

    void write(std::span<const std::byte> data) override {
        if (closed_) {
            throw SyncError{ErrorKind::invalid_state, "write to closed temporary '" + info_ + "'"};
        }
        file_hasher_.update(data);
        size_ += data.size();
        while (!data.empty()) {
            auto cut = chunker_.find_boundary(data);
            auto n = cut ? *cut : data.size();
            current_.insert(current_.end(), data.begin(), data.begin() + static_cast<std::ptrdiff_t>(n));
            data = data.subspan(n);
            if (cut) seal_chunk();
        }
    }

    void close() override {
        if (closed_) return;
        if (!current_.empty()) seal_chunk();

        auto data = std::make_shared<RamFileData>();
        data->key = SKey{file_hasher_.finish()};
        data->chunks = std::move(chunks_);
        data->size = size_;
        if (data->chunks.size() != 1) {
            storage_.register_file(data);
        }
        file_ = std::make_shared<RamFile>(std::move(data));
        closed_ = true;
    }

    auto file() -> std::shared_ptr<File> override {
        if (!closed_) {
            throw SyncError{ErrorKind::invalid_state, "temporary '" + info_ + "' not closed"};
        }
        return file_;
    }

private:
    void seal_chunk() {
        chunks_.push_back(storage_.insert_chunk(std::move(current_)));
        current_ = {};
    }

    RamStorage& storage_;
    std::string info_;
    storage::GearChunker chunker_;
    crypto::Sha256 file_hasher_;
    std::vector<std::byte> current_;
    std::vector<std::shared_ptr<const RamChunk>> chunks_;
    std::uint64_t size_ = 0;
    bool closed_ = false;
    std::shared_ptr<File> file_;
};

// -- RamStorage ---------------------------------------------------------------

RamStorage::RamStorage(std::uint64_t capacity, ChunkingParams params)
    : capacity_{capacity}, params_{params} {
    if (params_.min_size == 0 || params_.max_size < params_.min_size) {
        throw SyncError{ErrorKind::invalid_config, "chunking requires 0 < min_size <= max_size"};
    }
}

RamStorage::~RamStorage() = default;

auto RamStorage::create(std::string_view info) -> std::unique_ptr<Temporary> {
    return std::make_unique<RamTemporary>(*this, std::string{info});
}

auto RamStorage::get(const SKey& key) -> std::shared_ptr<File> {
    auto lock = std::scoped_lock{mutex_};
    if (auto it = chunks_.find(key); it != chunks_.end()) {
        lru_.splice(lru_.end(), lru_, it->second.lru_pos);
        return std::make_shared<RamFile>(single_chunk_file(it->second.chunk));
    }
    if (auto it = files_.find(key); it != files_.end()) {
        if (auto data = it->second.lock()) {
            return std::make_shared<RamFile>(std::move(data));
        }
        files_.erase(it);
    }
    return nullptr;
}

auto RamStorage::chunk_count() const -> std::size_t {
    auto lock = std::scoped_lock{mutex_};
    return chunks_.size();
}

auto RamStorage::unreferenced_chunk_count() const -> std::size_t {
    auto lock = std::scoped_lock{mutex_};
    return static_cast<std::size_t>(std::ranges::count_if(chunks_, [](const auto& kv) {
        return kv.second.chunk.use_count() == 1;
    }));
}

auto RamStorage::used_bytes() const -> std::uint64_t {
    auto lock = std::scoped_lock{mutex_};
    return used_;
}

auto RamStorage::insert_chunk(std::vector<std::byte> bytes) -> std::shared_ptr<const RamChunk> {
    auto key = SKey{crypto::sha256(bytes)};

    auto lock = std::scoped_lock{mutex_};
    if (auto it = chunks_.find(key); it != chunks_.end()) {
        lru_.splice(lru_.end(), lru_, it->second.lru_pos);
        return it->second.chunk;
    }

    evict_for(bytes.size());

    auto chunk = std::make_shared<const RamChunk>(RamChunk{.key = key, .bytes = std::move(bytes)});
    used_ += chunk->bytes.size();
    auto pos = lru_.insert(lru_.end(), key);
    chunks_.emplace(key, Entry{.chunk = chunk, .lru_pos = pos});
    return chunk;
}

void RamStorage::register_file(const std::shared_ptr<const RamFileData>& file) {
    auto lock = std::scoped_lock{mutex_};
    std::erase_if(files_, [](const auto& kv) { return kv.second.expired(); });
    files_[file->key] = file;
}

void RamStorage::evict_for(std::uint64_t bytes) {
    auto it = lru_.begin();
    while (used_ + bytes > capacity_ && it != lru_.end()) {
        auto entry = chunks_.find(*it);
        // Only the index holds it: no handle can observe the eviction
        if (entry->second.chunk.use_count() == 1) {
            used_ -= entry->second.chunk->bytes.size();
            chunks_.erase(entry);
            it = lru_.erase(it);
        } else {
            ++it;
        }
    }
    if (used_ + bytes > capacity_) {
        throw SyncError{ErrorKind::storage_error,
                        "storage full: " + std::to_string(used_) + " of " +
                        std::to_string(capacity_) + " bytes referenced"};
    }
}

}  // namespace remotesync_cpp
