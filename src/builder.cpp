#include <remotesync-cpp/builder.hpp>

#include <remotesync-cpp/error.hpp>
#include <remotesync-cpp/logging.hpp>
#include <remotesync-cpp/stream_shuffler.hpp>

#include "encoding/bit_stream.hpp"
#include "encoding/leb128.hpp"
#include "executor.hpp"

#include <chrono>
#include <deque>
#include <exception>
#include <future>
#include <string>
#include <utility>

namespace remotesync_cpp {

namespace {

// Outcome of one possession check, carried back from an executor worker.
struct Lookup {
    std::shared_ptr<File> file;
    std::exception_ptr error;
};

}  // namespace

Builder::Builder(FileStorage& storage, const Permutation& perm, unsigned concurrency, std::string info)
    : storage_{storage}, perm_{perm}, concurrency_{concurrency}, info_{std::move(info)} {
    if (concurrency_ == 0) {
        throw SyncError{ErrorKind::invalid_config, "builder concurrency must be at least 1"};
    }
    slots_.resize(perm_.size());
}

Builder::~Builder() = default;

auto Builder::advertised_chunks() const -> std::size_t {
    auto lock = std::scoped_lock{mutex_};
    return stats_.advertised_chunks;
}

auto Builder::requested_chunks() const -> std::size_t {
    auto lock = std::scoped_lock{mutex_};
    return stats_.requested_chunks;
}

auto Builder::requested_bytes() const -> std::uint64_t {
    auto lock = std::scoped_lock{mutex_};
    return stats_.requested_bytes;
}

auto Builder::expected_size() const -> std::uint64_t {
    auto lock = std::scoped_lock{mutex_};
    return stats_.expected_size;
}

void Builder::publish(std::size_t count, const Stats& stats) {
    {
        auto lock = std::scoped_lock{mutex_};
        published_ = count;
        stats_ = stats;
    }
    cv_.notify_all();
}

void Builder::finish_wishlist(std::exception_ptr error) {
    {
        auto lock = std::scoped_lock{mutex_};
        wishlist_error_ = std::move(error);
        wishlist_state_ = wishlist_error_ ? WishlistState::failed : WishlistState::done;
    }
    cv_.notify_all();
}

auto Builder::wait_for_slot(std::size_t index) -> const Slot& {
    auto lock = std::unique_lock{mutex_};
    cv_.wait(lock, [&] { return published_ > index || wishlist_state_ == WishlistState::failed; });
    if (published_ <= index) std::rethrow_exception(wishlist_error_);
    return slots_[index];
}

void Builder::wait_for_wishlist() {
    auto lock = std::unique_lock{mutex_};
    cv_.wait(lock, [&] {
        return wishlist_state_ == WishlistState::done || wishlist_state_ == WishlistState::failed;
    });
    if (wishlist_error_) std::rethrow_exception(wishlist_error_);
}

auto Builder::read_slot(ByteReader& hashes, std::size_t index) -> Slot {
    auto slot = Slot{};
    auto n = hashes.read_full(slot.key.bytes);
    if (n != SKey::size) {
        throw SyncError{ErrorKind::hash_list_malformed,
                        "hash list ended in slot " + std::to_string(index) + " of " +
                        std::to_string(perm_.size())};
    }
    slot.size = encoding::read_uleb128(hashes);
    if (slot.key == empty_key && slot.size != 0) {
        throw SyncError{ErrorKind::hash_list_malformed,
                        "placeholder in slot " + std::to_string(index) + " has size " +
                        std::to_string(slot.size)};
    }
    return slot;
}

void Builder::write_wishlist(ByteReader& hashes, ByteWriter& wishlist) {
    {
        auto lock = std::scoped_lock{mutex_};
        if (wishlist_state_ != WishlistState::idle) {
            throw SyncError{ErrorKind::invalid_state, "wishlist already written"};
        }
        wishlist_state_ = WishlistState::running;
    }
    log_event(LogLevel::info, "builder_wishlist_begin", {{"info", info_}, {"slots", perm_.size()}});

    const auto num_slots = perm_.size();
    const auto trace = Logger::instance().should_log(LogLevel::debug);
    auto stats = Stats{};

    // In logical order, every real chunk precedes every placeholder. Feeding
    // the slot sequence back through the inverse permutation checks that.
    auto inverse = InversePermutation{perm_};
    auto padding_seen = false;
    auto logical_order = StreamShuffler<bool>{inverse, true, [&](bool is_placeholder) {
        if (is_placeholder) {
            padding_seen = true;
        } else if (padding_seen) {
            throw SyncError{ErrorKind::hash_list_malformed,
                            "placeholder slots do not match the session permutation"};
        }
    }};

    auto bits = encoding::BitWriter{wishlist};
    auto& executor = detail::global_executor();
    auto in_flight = std::deque<std::future<Lookup>>{};
    std::size_t read_count = 0;
    std::size_t next_bit = 0;

    // Resolve slots whose lookup has completed, strictly in slot order,
    // publish them and write their bits. Blocks on the oldest lookup while
    // `concurrency_` or more are pending, or while `drain_all` is set.
    auto emit_ready = [&](bool drain_all) {
        auto resolved = next_bit;
        while (resolved < read_count) {
            auto& slot = slots_[resolved];
            if (slot.key != empty_key) {
                auto& front = in_flight.front();
                auto must_wait = drain_all || in_flight.size() >= concurrency_;
                if (!must_wait &&
                    front.wait_for(std::chrono::seconds{0}) != std::future_status::ready) {
                    break;
                }
                auto lookup = front.get();
                in_flight.pop_front();
                if (lookup.error) std::rethrow_exception(lookup.error);
                slot.local = std::move(lookup.file);
                slot.requested = (slot.local == nullptr);
                if (slot.requested) {
                    ++stats.requested_chunks;
                    stats.requested_bytes += slot.size;
                }
                if (trace) {
                    log_event(LogLevel::debug, "builder_wish",
                              {{"slot", resolved}, {"key", slot.key.short_hex()},
                               {"requested", slot.requested}});
                }
            }
            ++resolved;
        }
        if (resolved == next_bit) return;

        // Publish before writing: the bits may unblock data that
        // reconstruction can only place once it knows these slots.
        publish(resolved, stats);
        for (; next_bit < resolved; ++next_bit) {
            bits.write_bit(slots_[next_bit].requested);
        }
    };

    try {
        for (; read_count < num_slots;) {
            auto slot = read_slot(hashes, read_count);
            auto is_placeholder = (slot.key == empty_key);
            logical_order.put(is_placeholder);
            if (!is_placeholder) {
                ++stats.advertised_chunks;
                stats.expected_size += slot.size;
                in_flight.push_back(executor.async([&storage = storage_, key = slot.key] {
                    auto result = Lookup{};
                    try {
                        result.file = storage.get(key);
                    } catch (...) {
                        result.error = std::current_exception();
                    }
                    return result;
                }));
            }
            slots_[read_count] = std::move(slot);
            ++read_count;
            emit_ready(false);
        }
        logical_order.end();
        emit_ready(true);

        if (hashes.read_byte()) {
            throw SyncError{ErrorKind::hash_list_malformed,
                            "hash list continues past " + std::to_string(num_slots) + " slots"};
        }
        bits.finish();
    } catch (...) {
        // Lookups reference storage_; none may outlive this call.
        for (auto& lookup : in_flight) {
            if (lookup.valid()) lookup.wait();
        }
        finish_wishlist(std::current_exception());
        throw;
    }

    publish(num_slots, stats);
    finish_wishlist(nullptr);
    log_event(LogLevel::info, "builder_wishlist_end",
              {{"info", info_},
               {"chunks", stats.advertised_chunks},
               {"requested", stats.requested_chunks},
               {"requested_bytes", stats.requested_bytes}});
}

auto Builder::reconstruct_file(ByteReader& data) -> std::shared_ptr<File> {
    {
        auto lock = std::scoped_lock{mutex_};
        if (reconstruct_started_) {
            throw SyncError{ErrorKind::invalid_state, "file already reconstructed"};
        }
        reconstruct_started_ = true;
    }
    log_event(LogLevel::info, "builder_reconstruct_begin", {{"info", info_}});

    // Destroyed unclosed on any failure, which discards the partial file.
    auto temp = storage_.create(info_);

    // Chunk content waiting for its turn in logical order. Received bodies
    // are staged in the storage as files of their own, so pending pieces
    // cost the storage whatever a chunk costs there, not process memory.
    struct Piece {
        std::shared_ptr<File> content;  // null for placeholders
        std::uint64_t size = 0;
        SKey key;
    };

    // Chunk data arrives in slot order; the file is written in logical order.
    auto inverse = InversePermutation{perm_};
    auto assembler = StreamShuffler<Piece>{inverse, Piece{}, [&](const Piece& piece) {
        if (!piece.content) return;
        auto reader = piece.content->open();
        auto copied = copy_stream(*reader, *temp);
        if (copied != piece.size) {
            throw SyncError{ErrorKind::short_chunk_read,
                            "chunk " + piece.key.to_hex() + " yielded " + std::to_string(copied) +
                            " of " + std::to_string(piece.size) + " bytes"};
        }
    }};

    for (std::size_t i = 0; i < perm_.size(); ++i) {
        const auto& slot = wait_for_slot(i);
        auto piece = Piece{.content = slot.local, .size = slot.size, .key = slot.key};
        if (slot.requested) {
            auto size = encoding::read_uleb128_or_end(data);
            if (!size) {
                throw SyncError{ErrorKind::short_chunk_read,
                                "chunk data ended before slot " + std::to_string(i)};
            }
            if (*size != slot.size) {
                throw SyncError{ErrorKind::short_chunk_read,
                                "slot " + std::to_string(i) + " advertised " +
                                std::to_string(slot.size) + " bytes but carries " +
                                std::to_string(*size)};
            }
            // Destroyed unclosed if the body is cut short.
            auto staged = storage_.create(info_);
            auto body = LimitedReader{data, slot.size};
            if (copy_stream(body, *staged) != slot.size) {
                throw SyncError{ErrorKind::short_chunk_read,
                                "chunk data for slot " + std::to_string(i) + " truncated"};
            }
            staged->close();
            piece.content = staged->file();
        }
        assembler.put(std::move(piece));
    }

    // The hash list is only known to be well formed once the wishlist is done.
    wait_for_wishlist();
    assembler.end();

    if (data.read_byte()) {
        throw SyncError{ErrorKind::short_chunk_read, "chunk data continues past the last requested chunk"};
    }

    temp->close();
    auto file = temp->file();
    if (file->size() != expected_size()) {
        throw SyncError{ErrorKind::short_chunk_read,
                        "reconstructed " + std::to_string(file->size()) + " of " +
                        std::to_string(expected_size()) + " bytes"};
    }

    // Local chunks are part of the new file now.
    slots_.clear();
    log_event(LogLevel::info, "builder_reconstruct_end",
              {{"info", info_}, {"file", file->key().short_hex()}, {"size", file->size()}});
    return file;
}

}  // namespace remotesync_cpp
