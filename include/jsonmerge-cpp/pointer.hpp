/// @file pointer.hpp
/// @brief JSON Pointer (RFC 6901) parsing and token escaping.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jsonmerge_cpp {

/// Decode one reference token: "~1" -> "/", then "~0" -> "~".
///
/// A single left-to-right scan, so "~01" decodes to "~1" rather than "/".
/// Other '~' sequences are left as they are.
auto unescape_token(std::string_view token) -> std::string;

/// Encode one reference token: "~" -> "~0", "/" -> "~1".
auto escape_token(std::string_view token) -> std::string;

/// A parsed JSON Pointer: an ordered list of decoded reference tokens.
///
/// The empty pointer "" has no tokens and denotes the whole document.
/// "/" has one empty-string token. "/a/b/0" has tokens ["a", "b", "0"].
class Pointer {
public:
    /// The root pointer "".
    Pointer() = default;

    /// Construct from already-decoded tokens.
    explicit Pointer(std::vector<std::string> tokens)
        : tokens_{std::move(tokens)} {}

    /// Parse a pointer string.
    /// @throws PatchError (invalid_pointer) if non-empty and not starting with '/'.
    static auto parse(std::string_view pointer) -> Pointer;

    auto tokens() const -> const std::vector<std::string>& { return tokens_; }
    auto size() const -> std::size_t { return tokens_.size(); }

    /// True for the root pointer "".
    auto empty() const -> bool { return tokens_.empty(); }

    /// The final token. Requires !empty().
    auto back() const -> const std::string& { return tokens_.back(); }

    /// The pointer to the parent location. The parent of "" is "".
    auto parent() const -> Pointer;

    /// True if this pointer names a proper ancestor of `other`.
    auto is_prefix_of(const Pointer& other) const -> bool;

    /// Render back to an escaped pointer string.
    auto to_string() const -> std::string;

    auto operator==(const Pointer&) const -> bool = default;

private:
    std::vector<std::string> tokens_;
};

}  // namespace jsonmerge_cpp
