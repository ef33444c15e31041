/// @file builder.hpp
/// @brief Receiver side of the protocol: wishlist generation and file reconstruction.

#pragma once

#include <remotesync-cpp/io.hpp>
#include <remotesync-cpp/permutation.hpp>
#include <remotesync-cpp/storage.hpp>
#include <remotesync-cpp/types.hpp>

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace remotesync_cpp {

/// Rebuilds one file sent by a peer into local storage.
///
/// A Builder is used for exactly one session: write_wishlist() consumes the
/// sender's hash list and answers with the wishlist, and reconstruct_file()
/// consumes the chunk data and returns the new file. The two may run on
/// different threads at the same time; reconstruction then follows the
/// wishlist slot by slot. Handles to every locally available chunk are held
/// until reconstruction so that they stay resident.
///
/// @code
/// auto builder = Builder{store, perm, 8, "copy of report.pdf"};
/// builder.write_wishlist(hash_stream, wishlist_stream);
/// auto file = builder.reconstruct_file(data_stream);
/// @endcode
class Builder {
public:
    /// @param storage Local store: possession checks and destination.
    /// @param perm The session permutation; must outlive the builder.
    /// @param concurrency Maximum storage lookups in flight (>= 1).
    /// @param info Label for the reconstructed file.
    Builder(FileStorage& storage, const Permutation& perm, unsigned concurrency, std::string info);
    ~Builder();

    Builder(const Builder&) = delete;
    auto operator=(const Builder&) -> Builder& = delete;

    /// Phase 2. Read perm.size() hash-list entries from `hashes` and write
    /// one wishlist bit per slot to `wishlist`: true for chunks missing
    /// locally, false for chunks already present and for placeholders.
    ///
    /// @throws SyncError{hash_list_malformed} if the list is truncated, has
    ///   trailing bytes, or its placeholders are inconsistent with `perm`.
    void write_wishlist(ByteReader& hashes, ByteWriter& wishlist);

    /// Phase 4. Read requested chunk data from `data` and assemble the file
    /// in its original chunk order.
    ///
    /// Blocks until write_wishlist() has resolved each slot it needs, so it
    /// must run after or alongside write_wishlist(). If the wishlist fails,
    /// its exception is rethrown here. Each received chunk is staged in the
    /// storage as a temporary of its own until its turn in chunk order comes.
    ///
    /// @throws SyncError{short_chunk_read} on truncated data, size
    ///   mismatches or trailing bytes. The partial file is discarded.
    auto reconstruct_file(ByteReader& data) -> std::shared_ptr<File>;

    // Statistics are final once write_wishlist() has returned.

    /// Real chunks advertised by the sender.
    auto advertised_chunks() const -> std::size_t;

    /// Chunks marked as requested in the wishlist.
    auto requested_chunks() const -> std::size_t;

    /// Sum of the sizes of requested chunks.
    auto requested_bytes() const -> std::uint64_t;

    /// Size of the file being rebuilt.
    auto expected_size() const -> std::uint64_t;

private:
    enum class WishlistState { idle, running, done, failed };

    struct Slot {
        SKey key;
        std::uint64_t size = 0;
        bool requested = false;
        std::shared_ptr<File> local;  // set for present, unrequested chunks
    };

    struct Stats {
        std::size_t advertised_chunks = 0;
        std::size_t requested_chunks = 0;
        std::uint64_t requested_bytes = 0;
        std::uint64_t expected_size = 0;
    };

    auto read_slot(ByteReader& hashes, std::size_t index) -> Slot;

    // Make slots_[0, count) visible to reconstruct_file().
    void publish(std::size_t count, const Stats& stats);
    void finish_wishlist(std::exception_ptr error);

    // Block until slot `index` is published. Rethrows a wishlist failure.
    auto wait_for_slot(std::size_t index) -> const Slot&;
    void wait_for_wishlist();

    FileStorage& storage_;
    const Permutation& perm_;
    unsigned concurrency_;
    std::string info_;

    // Sized once; written by write_wishlist(), read by reconstruct_file()
    // only below published_.
    std::vector<Slot> slots_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    WishlistState wishlist_state_ = WishlistState::idle;
    std::exception_ptr wishlist_error_;
    std::size_t published_ = 0;
    bool reconstruct_started_ = false;
    Stats stats_;
};

}  // namespace remotesync_cpp
