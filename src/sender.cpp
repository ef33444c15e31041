#include <remotesync-cpp/sender.hpp>

#include <remotesync-cpp/error.hpp>
#include <remotesync-cpp/logging.hpp>
#include <remotesync-cpp/stream_shuffler.hpp>

#include "encoding/bit_stream.hpp"
#include "encoding/leb128.hpp"

#include <string>

namespace remotesync_cpp {

namespace {

struct HashEntry {
    SKey key;
    std::uint64_t size = 0;
};

}  // namespace

void write_chunk_hashes(const File& file, const Permutation& perm, ByteWriter& out) {
    log_event(LogLevel::info, "sender_hashes_begin",
              {{"file", file.key().short_hex()}, {"slots", perm.size()}});

    const auto trace = Logger::instance().should_log(LogLevel::debug);
    auto shuffler = StreamShuffler<HashEntry>{perm, HashEntry{empty_key, 0}, [&](const HashEntry& e) {
        if (trace) {
            log_event(LogLevel::debug, "sender_hash_slot",
                      {{"key", e.key.short_hex()}, {"size", e.size}});
        }
        out.write(e.key.bytes);
        encoding::write_uleb128(out, e.size);
    }};

    auto chunks = file.chunks();
    while (chunks->next()) {
        shuffler.put(HashEntry{chunks->key(), chunks->size()});
    }
    shuffler.end();
    out.flush();

    log_event(LogLevel::info, "sender_hashes_end",
              {{"file", file.key().short_hex()}, {"chunks", shuffler.put_count()}});
}

void for_each_chunk(FileStorage& storage, const File& file, ByteReader& wishlist,
                    const Permutation& perm, const ChunkVisitor& visit) {
    auto bits = encoding::BitReader{wishlist};

    // Replay the chunk order of phase 1 so every key meets the wishlist bit
    // the receiver wrote for its slot.
    auto shuffler = StreamShuffler<SKey>{perm, empty_key, [&](const SKey& key) {
        auto requested = bits.read_bit();
        if (key == empty_key) {
            if (requested) {
                throw SyncError{ErrorKind::spurious_request,
                                "receiver requested placeholder slot " +
                                std::to_string(bits.bits_read() - 1)};
            }
            return;
        }
        auto chunk = storage.get(key);
        if (!chunk) {
            throw SyncError{ErrorKind::chunk_not_found, "chunk " + key.to_hex() + " not in storage"};
        }
        visit(chunk, requested);
    }};

    auto chunks = file.chunks();
    while (chunks->next()) {
        shuffler.put(chunks->key());
    }
    shuffler.end();

    bits.expect_end();
}

auto write_chunk_data(FileStorage& storage, const File& file, ByteReader& wishlist,
                      const Permutation& perm, ByteWriter& out,
                      const TransferStatusCallback& on_status) -> TransferStatus {
    log_event(LogLevel::info, "sender_data_begin", {{"file", file.key().short_hex()}});

    // Start from the whole file and subtract every chunk the receiver
    // already has.
    auto status = TransferStatus{.bytes_to_transfer = file.size()};
    if (on_status) on_status(status.bytes_to_transfer, status.bytes_transferred);

    for_each_chunk(storage, file, wishlist, perm,
                   [&](const std::shared_ptr<File>& chunk, bool requested) {
        if (requested) {
            encoding::write_uleb128(out, chunk->size());
            auto reader = chunk->open();
            auto copied = copy_stream(*reader, out);
            if (copied != chunk->size()) {
                throw SyncError{ErrorKind::short_chunk_read,
                                "chunk " + chunk->key().to_hex() + " yielded " +
                                std::to_string(copied) + " of " +
                                std::to_string(chunk->size()) + " bytes"};
            }
            status.bytes_transferred += copied;
            ++status.chunks_transferred;
        } else {
            status.bytes_to_transfer -= chunk->size();
        }
        if (on_status) on_status(status.bytes_to_transfer, status.bytes_transferred);
    });
    out.flush();

    log_event(LogLevel::info, "sender_data_end",
              {{"file", file.key().short_hex()},
               {"chunks", status.chunks_transferred},
               {"bytes", status.bytes_transferred}});
    return status;
}

}  // namespace remotesync_cpp
