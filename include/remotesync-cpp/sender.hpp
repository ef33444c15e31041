/// @file sender.hpp
/// @brief Sender side of the protocol: hash advertisement and chunk delivery.

#pragma once

#include <remotesync-cpp/io.hpp>
#include <remotesync-cpp/permutation.hpp>
#include <remotesync-cpp/storage.hpp>
#include <remotesync-cpp/types.hpp>

#include <functional>
#include <memory>

namespace remotesync_cpp {

/// Phase 1. Write `key || uleb128(size)` for every slot of `perm`, real
/// chunks in shuffled positions and placeholders `(empty_key, 0)` elsewhere.
///
/// The output length depends only on perm.size(), never on the chunk count.
/// @throws SyncError{permutation_exhausted} if the file has more chunks
///   than the permutation has slots; rethrows writer failures.
void write_chunk_hashes(const File& file, const Permutation& perm, ByteWriter& out);

/// Called for each real chunk of a file in slot order.
using ChunkVisitor = std::function<void(const std::shared_ptr<File>& chunk, bool requested)>;

/// Walk the slots of `file` under `perm`, pairing each with the next bit of
/// `wishlist`, and call `visit` for every real chunk.
///
/// Placeholder slots must carry a false bit (spurious_request otherwise).
/// Every real key is resolved through `storage` (chunk_not_found if absent).
/// The wishlist must hold exactly perm.size() bits (wishlist_too_short /
/// wishlist_too_long).
void for_each_chunk(FileStorage& storage, const File& file, ByteReader& wishlist,
                    const Permutation& perm, const ChunkVisitor& visit);

/// Phase 3. Write `uleb128(size) || bytes` for every requested chunk in slot
/// order; nothing for unrequested or placeholder slots.
///
/// `on_status` (optional) is called once with (file.size(), 0) before the
/// first chunk and again after every real chunk.
/// @return The final transfer status.
auto write_chunk_data(FileStorage& storage, const File& file, ByteReader& wishlist,
                      const Permutation& perm, ByteWriter& out,
                      const TransferStatusCallback& on_status = {}) -> TransferStatus;

}  // namespace remotesync_cpp
