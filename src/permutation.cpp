#include <remotesync-cpp/permutation.hpp>

#include <limits>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>

namespace remotesync_cpp {

namespace {

void check_index(std::size_t index, std::size_t size) {
    if (index >= size) {
        throw std::out_of_range{"permutation index " + std::to_string(index) +
                                " outside domain of size " + std::to_string(size)};
    }
}

// Unbiased draw from [0, bound) by rejection. std::uniform_int_distribution
// is implementation-defined, which would break cross-platform agreement.
auto draw_below(std::mt19937_64& rng, std::uint64_t bound) -> std::uint64_t {
    const auto limit = std::numeric_limits<std::uint64_t>::max() -
                       (std::numeric_limits<std::uint64_t>::max() % bound);
    while (true) {
        auto v = rng();
        if (v < limit) return v % bound;
    }
}

auto checked_domain(std::size_t n) -> std::size_t {
    if (n > std::numeric_limits<std::uint32_t>::max()) {
        throw std::length_error{"permutation domain too large"};
    }
    return n;
}

}  // namespace

auto IdentityPermutation::forward(std::size_t index) const -> std::size_t {
    check_index(index, size_);
    return index;
}

auto IdentityPermutation::inverse(std::size_t slot) const -> std::size_t {
    check_index(slot, size_);
    return slot;
}

RandomPermutation::RandomPermutation(std::uint64_t seed, std::size_t n)
    : seed_{seed}, forward_(checked_domain(n)), inverse_(n) {
    for (std::size_t i = 0; i < n; ++i) {
        forward_[i] = static_cast<std::uint32_t>(i);
    }

    auto rng = std::mt19937_64{seed};
    for (std::size_t i = n; i > 1; --i) {
        auto j = static_cast<std::size_t>(draw_below(rng, i));
        std::swap(forward_[i - 1], forward_[j]);
    }

    for (std::size_t i = 0; i < n; ++i) {
        inverse_[forward_[i]] = static_cast<std::uint32_t>(i);
    }
}

auto RandomPermutation::forward(std::size_t index) const -> std::size_t {
    check_index(index, forward_.size());
    return forward_[index];
}

auto RandomPermutation::inverse(std::size_t slot) const -> std::size_t {
    check_index(slot, inverse_.size());
    return inverse_[slot];
}

}  // namespace remotesync_cpp
