#include <remotesync-cpp/types.hpp>

namespace remotesync_cpp {

namespace {

auto hex_char_to_nibble(char c) -> std::optional<std::uint8_t> {
    if (c >= '0' && c <= '9') return static_cast<std::uint8_t>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<std::uint8_t>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<std::uint8_t>(c - 'A' + 10);
    return std::nullopt;
}

}  // namespace

auto SKey::to_hex() const -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    auto result = std::string{};
    result.reserve(size * 2);
    for (auto b : bytes) {
        auto v = static_cast<unsigned char>(b);
        result.push_back(hex_chars[v >> 4]);
        result.push_back(hex_chars[v & 0x0F]);
    }
    return result;
}

auto SKey::from_hex(std::string_view hex) -> std::optional<SKey> {
    if (hex.size() != size * 2) return std::nullopt;
    auto key = SKey{};
    for (std::size_t i = 0; i < size; ++i) {
        auto hi = hex_char_to_nibble(hex[i * 2]);
        auto lo = hex_char_to_nibble(hex[i * 2 + 1]);
        if (!hi || !lo) return std::nullopt;
        key.bytes[i] = static_cast<std::byte>((*hi << 4) | *lo);
    }
    return key;
}

}  // namespace remotesync_cpp
