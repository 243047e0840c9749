/// @file error.hpp
/// @brief Error types for the jsonmerge-cpp library.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace jsonmerge_cpp {

/// Categories of errors that can occur while decoding or applying a patch.
enum class ErrorKind : std::uint8_t {
    parse_error,          ///< Input bytes are not valid JSON.
    malformed_patch,      ///< Patch is not an array of objects.
    missing_field,        ///< An operation lacks a field its kind requires.
    invalid_pointer,      ///< A JSON Pointer does not start with '/'.
    path_not_found,       ///< A pointer segment does not exist or cannot be descended into.
    invalid_index,        ///< An array token is not a valid index or is out of range.
    precondition_failed,  ///< A replace/move precondition does not hold.
    test_failed,          ///< A test operation found a different value.
    unknown_operation,    ///< The "op" field names no known operation.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::parse_error:         return "parse_error";
        case ErrorKind::malformed_patch:     return "malformed_patch";
        case ErrorKind::missing_field:       return "missing_field";
        case ErrorKind::invalid_pointer:     return "invalid_pointer";
        case ErrorKind::path_not_found:      return "path_not_found";
        case ErrorKind::invalid_index:       return "invalid_index";
        case ErrorKind::precondition_failed: return "precondition_failed";
        case ErrorKind::test_failed:         return "test_failed";
        case ErrorKind::unknown_operation:   return "unknown_operation";
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

/// Exception thrown by every failing decode, resolve or apply step.
///
/// Errors raised below the engine (pointer parsing, container access)
/// carry only an Error. The engine rethrows them with the index, kind
/// and path of the operation that failed.
class PatchError : public std::runtime_error {
public:
    /// Construct from a bare error with no operation context.
    explicit PatchError(Error err);

    /// Construct with the context of the failing operation.
    PatchError(Error err, std::size_t op_index, std::string op, std::string path);

    /// Construct from a kind and message.
    PatchError(ErrorKind kind, std::string message)
        : PatchError(Error{kind, std::move(message)}) {}

    auto error() const noexcept -> const Error& { return error_; }
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

    /// Index of the failing operation within its patch, if known.
    auto op_index() const noexcept -> std::optional<std::size_t> { return op_index_; }

    /// The "op" name of the failing operation (empty without context).
    auto op() const noexcept -> const std::string& { return op_; }

    /// The "path" of the failing operation (empty without context).
    auto path() const noexcept -> const std::string& { return path_; }

private:
    Error error_;
    std::optional<std::size_t> op_index_{};
    std::string op_;
    std::string path_;
};

}  // namespace jsonmerge_cpp
