/// @file resolver.hpp
/// @brief Walk a JSON Pointer to the container that holds its target.

#pragma once

#include <jsonmerge-cpp/container.hpp>
#include <jsonmerge-cpp/pointer.hpp>
#include <jsonmerge-cpp/value.hpp>

#include <string>
#include <string_view>

namespace jsonmerge_cpp {

/// The mutation target of a pointer: its parent container and final token.
struct Target {
    Container parent;  ///< Container holding (or about to hold) the target.
    std::string key;   ///< Decoded final token of the pointer.
};

/// Resolve `pointer` against `root` to its (parent, key) pair.
///
/// Only the intermediate tokens are walked; the final token is not
/// looked up, so the target itself need not exist (add creates it).
/// The returned container borrows from `root` and is invalidated by any
/// structural change to the tree.
///
/// @throws PatchError (path_not_found) for the root pointer, a scalar
///   root, or an intermediate segment that is missing or a scalar.
/// @throws PatchError (invalid_index) for a malformed intermediate array token.
auto resolve(Json& root, const Pointer& pointer) -> Target;

/// The value at `pointer`. The root pointer yields `root` itself.
/// @throws PatchError if any segment, including the last, does not exist.
auto value_at(Json& root, const Pointer& pointer) -> Json&;

/// Non-throwing lookup for callers that only read.
/// @return The value, or nullptr if the pointer is malformed or absent.
auto find(const Json& root, std::string_view pointer) -> const Json*;

}  // namespace jsonmerge_cpp
