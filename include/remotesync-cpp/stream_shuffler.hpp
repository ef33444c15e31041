/// @file stream_shuffler.hpp
/// @brief Online reordering of a logical-order stream into a fixed-size slot order.

#pragma once

#include <remotesync-cpp/error.hpp>
#include <remotesync-cpp/permutation.hpp>

#include <cstddef>
#include <exception>
#include <functional>
#include <map>
#include <string>
#include <utility>

namespace remotesync_cpp {

/// Re-emits items pushed in logical order in the slot order of a permutation,
/// padding every slot that receives no item with a placeholder.
///
/// The k-th put() lands in slot perm.forward(k). Whenever the lowest
/// unemitted slot is filled, it and every consecutive filled slot after it
/// are handed to the consumer. end() fills the remaining slots with the
/// placeholder. Across a complete put*()/end() sequence the consumer runs
/// exactly perm.size() times, for slots 0, 1, ..., size()-1.
///
/// The consumer reports failure by throwing. The exception propagates out of
/// put() or end() and the shuffler stays failed: later calls rethrow the same
/// exception and emit nothing.
///
/// Only items that arrive ahead of the emission cursor are buffered, so
/// memory is bounded by how far the permutation pulls items forward.
///
/// @code
/// auto perm = RandomPermutation{seed, 1024};
/// auto shuffler = StreamShuffler<SKey>{perm, empty_key, [&](const SKey& k) {
///     out.write(k.bytes);
/// }};
/// for (auto& key : keys) shuffler.put(key);
/// shuffler.end();
/// @endcode
template <typename T>
class StreamShuffler {
public:
    using Consumer = std::function<void(const T&)>;

    StreamShuffler(const Permutation& perm, T placeholder, Consumer consumer)
        : perm_{perm}, placeholder_{std::move(placeholder)}, consumer_{std::move(consumer)} {}

    StreamShuffler(const StreamShuffler&) = delete;
    auto operator=(const StreamShuffler&) -> StreamShuffler& = delete;

    /// Accept the next item in logical order.
    /// @throws SyncError{permutation_exhausted} after size() puts.
    void put(T item) {
        check_usable();
        if (put_count_ >= perm_.size()) {
            throw SyncError{ErrorKind::permutation_exhausted,
                            "more than " + std::to_string(perm_.size()) + " items put into shuffler"};
        }
        auto slot = perm_.forward(put_count_);
        ++put_count_;
        pending_.emplace(slot, std::move(item));
        drain();
    }

    /// Declare the logical stream complete and emit every remaining slot.
    void end() {
        check_usable();
        ended_ = true;
        while (next_slot_ < perm_.size()) {
            auto it = pending_.begin();
            if (it != pending_.end() && it->first == next_slot_) {
                auto node = pending_.extract(it);
                emit(node.mapped());
            } else {
                emit(placeholder_);
            }
        }
    }

    auto size() const -> std::size_t { return perm_.size(); }
    auto put_count() const -> std::size_t { return put_count_; }
    auto emitted() const -> std::size_t { return next_slot_; }
    auto pending() const -> std::size_t { return pending_.size(); }
    auto ended() const -> bool { return ended_; }

private:
    void check_usable() const {
        if (failure_) std::rethrow_exception(failure_);
        if (ended_) {
            throw SyncError{ErrorKind::invalid_state, "shuffler already ended"};
        }
    }

    void drain() {
        while (!pending_.empty() && pending_.begin()->first == next_slot_) {
            auto node = pending_.extract(pending_.begin());
            emit(node.mapped());
        }
    }

    void emit(const T& item) {
        try {
            consumer_(item);
        } catch (...) {
            failure_ = std::current_exception();
            throw;
        }
        ++next_slot_;
    }

    const Permutation& perm_;
    T placeholder_;
    Consumer consumer_;
    std::map<std::size_t, T> pending_;  // slot -> item, only slots >= next_slot_
    std::size_t next_slot_ = 0;
    std::size_t put_count_ = 0;
    bool ended_ = false;
    std::exception_ptr failure_;
};

}  // namespace remotesync_cpp
