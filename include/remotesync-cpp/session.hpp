/// @file session.hpp
/// @brief Runs all protocol phases of one transfer concurrently in-process.

#pragma once

#include <remotesync-cpp/builder.hpp>
#include <remotesync-cpp/config.hpp>
#include <remotesync-cpp/permutation.hpp>
#include <remotesync-cpp/storage.hpp>
#include <remotesync-cpp/types.hpp>

#include <memory>
#include <string>

namespace remotesync_cpp {

struct SessionOptions {
    /// Progress of the data stage, called on a session worker thread.
    TransferStatusCallback on_status;
};

/// Transfer `source` from `source_storage` into the builder's storage.
///
/// The sender's two stages, the wishlist stage and reconstruction (on the
/// calling thread) run concurrently, connected by three synchronous pipes.
/// Each session runs its stages on three workers of its own, so any number
/// of sessions may run at once from different threads.
/// A failing stage closes its pipes with its exception, so every other
/// stage unwinds too.
///
/// @return The reconstructed file.
/// @throws The first failure raised by any stage.
auto run_session(FileStorage& source_storage, std::shared_ptr<File> source, Builder& builder,
                 const Permutation& perm, SessionOptions options = {}) -> std::shared_ptr<File>;

/// run_session() with the permutation and builder derived from `config`.
auto transfer_file(FileStorage& source_storage, std::shared_ptr<File> source,
                   FileStorage& destination, const SyncConfig& config,
                   std::string info = {}, SessionOptions options = {})
    -> std::shared_ptr<File>;

}  // namespace remotesync_cpp
