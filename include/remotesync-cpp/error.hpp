/// @file error.hpp
/// @brief Error types for the remotesync-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace remotesync_cpp {

/// Categories of errors that can occur during a synchronization session.
///
/// Every error is terminal for the session it occurs in.
enum class ErrorKind : std::uint8_t {
    malformed_varint,       ///< Truncated or overlong LEB128 integer.
    wishlist_too_short,     ///< Wishlist ended before every slot had a bit.
    wishlist_too_long,      ///< Wishlist carried bytes past the last slot.
    spurious_request,       ///< A placeholder slot was requested.
    chunk_not_found,        ///< A chunk key could not be resolved in storage.
    short_chunk_read,       ///< Chunk data was truncated or its size mismatched.
    hash_list_malformed,    ///< The advertised hash list is inconsistent.
    permutation_exhausted,  ///< More items were put than the permutation has slots.
    io_error,               ///< An underlying byte channel failed or was closed.
    storage_error,          ///< The content store could not satisfy a request.
    invalid_config,         ///< A configuration value is missing or out of range.
    invalid_state,          ///< An operation was called out of order.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::malformed_varint:      return "malformed_varint";
        case ErrorKind::wishlist_too_short:    return "wishlist_too_short";
        case ErrorKind::wishlist_too_long:     return "wishlist_too_long";
        case ErrorKind::spurious_request:      return "spurious_request";
        case ErrorKind::chunk_not_found:       return "chunk_not_found";
        case ErrorKind::short_chunk_read:      return "short_chunk_read";
        case ErrorKind::hash_list_malformed:   return "hash_list_malformed";
        case ErrorKind::permutation_exhausted: return "permutation_exhausted";
        case ErrorKind::io_error:              return "io_error";
        case ErrorKind::storage_error:         return "storage_error";
        case ErrorKind::invalid_config:        return "invalid_config";
        case ErrorKind::invalid_state:         return "invalid_state";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// The exception thrown by every protocol operation.
///
/// what() returns "<kind>: <message>"; error() exposes the structured form.
class SyncError : public std::runtime_error {
public:
    explicit SyncError(Error err)
        : std::runtime_error{std::string{to_string_view(err.kind)} + ": " + err.message},
          error_{std::move(err)} {}

    SyncError(ErrorKind kind, std::string message)
        : SyncError{Error{kind, std::move(message)}} {}

    auto error() const noexcept -> const Error& { return error_; }
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

}  // namespace remotesync_cpp
