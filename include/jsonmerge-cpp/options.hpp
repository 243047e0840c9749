/// @file options.hpp
/// @brief Apply-time configuration and the per-operation observer hook.

#pragma once

#include <jsonmerge-cpp/error.hpp>
#include <jsonmerge-cpp/operation.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string_view>

namespace jsonmerge_cpp {

/// How a move operation treats its source.
enum class MoveMode : std::uint8_t {
    rfc6902,      ///< Remove the source, then add at the destination.
    keep_source,  ///< Add at the destination and leave the source in place.
};

/// Severity attached to an observer event.
enum class Severity : std::uint8_t {
    debug,  ///< An operation was applied.
    error,  ///< An operation failed and the patch was aborted.
};

/// Convert a Severity to its string representation.
constexpr auto to_string_view(Severity severity) noexcept -> std::string_view {
    switch (severity) {
        case Severity::debug: return "debug";
        case Severity::error: return "error";
    }
    return "unknown";
}

/// Reported once per operation, after it either succeeded or failed.
struct OpEvent {
    Severity severity;            ///< debug on success, error on failure.
    std::size_t index;            ///< Position of the operation in its patch.
    OpType type;                  ///< Parsed "op".
    std::string_view path;        ///< The operation's "path" (empty if absent).
    const Error* error{nullptr};  ///< The failure, when severity is error.
};

/// Callback receiving OpEvents. Called synchronously on the applying thread.
using Observer = std::function<void(const OpEvent&)>;

/// Configuration for applying a patch. The defaults give RFC 6902 behaviour.
struct ApplyOptions {
    /// Snapshot the document first and restore it if any operation fails.
    bool atomic{false};

    /// Move semantics. keep_source reproduces the legacy behaviour.
    MoveMode move_mode{MoveMode::rfc6902};

    /// Optional per-operation hook. Empty means no events.
    Observer observer{};
};

}  // namespace jsonmerge_cpp
