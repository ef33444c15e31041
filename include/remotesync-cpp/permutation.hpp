/// @file permutation.hpp
/// @brief Bijections over the slot index space used to shuffle the wire order.

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace remotesync_cpp {

/// A deterministic bijection over [0, size()).
///
/// forward() maps a logical (storage-order) index to its slot in the
/// shuffled output; inverse() maps a slot back. Both peers of a session must
/// construct equal permutations. Indices outside the domain throw
/// std::out_of_range.
class Permutation {
public:
    virtual ~Permutation() = default;

    virtual auto size() const -> std::size_t = 0;
    virtual auto forward(std::size_t index) const -> std::size_t = 0;
    virtual auto inverse(std::size_t slot) const -> std::size_t = 0;
};

/// Maps every index to itself.
class IdentityPermutation : public Permutation {
public:
    explicit IdentityPermutation(std::size_t n) : size_{n} {}

    auto size() const -> std::size_t override { return size_; }
    auto forward(std::size_t index) const -> std::size_t override;
    auto inverse(std::size_t slot) const -> std::size_t override;

private:
    std::size_t size_;
};

/// A uniformly random permutation derived from a 64-bit seed.
///
/// Fisher-Yates driven by std::mt19937_64 with an explicit range reduction,
/// so equal (seed, n) yield equal permutations on every platform.
class RandomPermutation : public Permutation {
public:
    RandomPermutation(std::uint64_t seed, std::size_t n);

    auto size() const -> std::size_t override { return forward_.size(); }
    auto forward(std::size_t index) const -> std::size_t override;
    auto inverse(std::size_t slot) const -> std::size_t override;

    auto seed() const -> std::uint64_t { return seed_; }

private:
    std::uint64_t seed_;
    std::vector<std::uint32_t> forward_;
    std::vector<std::uint32_t> inverse_;
};

/// Non-owning view that swaps forward and inverse of another permutation.
///
/// Feeding slot-ordered items through a StreamShuffler with this view
/// restores logical order.
class InversePermutation : public Permutation {
public:
    explicit InversePermutation(const Permutation& inner) : inner_{inner} {}

    auto size() const -> std::size_t override { return inner_.size(); }
    auto forward(std::size_t index) const -> std::size_t override { return inner_.inverse(index); }
    auto inverse(std::size_t slot) const -> std::size_t override { return inner_.forward(slot); }

private:
    const Permutation& inner_;
};

}  // namespace remotesync_cpp
