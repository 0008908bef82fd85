/// @file error.hpp
/// @brief Error types for the oplog-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace oplog_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    transient_network,   ///< A transport send failed; the operation may be retried.
    rejected_operation,  ///< The server refused the operation.
    missing_referent,    ///< A replay target no longer exists in the document.
    invalid_operation,   ///< The transport cannot send the operation at all.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::transient_network:  return "transient_network";
        case ErrorKind::rejected_operation: return "rejected_operation";
        case ErrorKind::missing_referent:   return "missing_referent";
        case ErrorKind::invalid_operation:  return "invalid_operation";
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

/// Thrown by Transport::emit_operation() when a send fails.
///
/// The operation queue treats it as a retryable failure.
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace oplog_cpp
