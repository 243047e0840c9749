/// @file engine.hpp
/// @brief Applying JSON Patch operations to a document tree.

#pragma once

#include <jsonmerge-cpp/error.hpp>
#include <jsonmerge-cpp/operation.hpp>
#include <jsonmerge-cpp/options.hpp>
#include <jsonmerge-cpp/patch.hpp>
#include <jsonmerge-cpp/value.hpp>

#include <optional>
#include <span>
#include <vector>

namespace jsonmerge_cpp {

/// Apply a single operation to `doc`.
///
/// A root-level replace assigns the new root through `doc`.
/// @throws PatchError without operation context on failure.
void apply_operation(Json& doc, const Operation& op,
                     MoveMode move_mode = MoveMode::rfc6902);

/// Apply every operation of `patch` to `doc`, in order.
///
/// Stops at the first failing operation and rethrows its error with the
/// operation's index, kind and path. Operations before it stay applied
/// unless `options.atomic` is set, in which case `doc` is restored to its
/// state before the call.
///
/// `doc` must not be accessed by any other thread during the call.
/// @throws PatchError on the first failure.
void apply_patch(Json& doc, const Patch& patch, const ApplyOptions& options = {});

/// Apply `patch` to each of several independent documents concurrently.
///
/// Every document is patched on its own, strictly in operation order;
/// only distinct documents run in parallel. A failure in one document
/// does not affect the others. The observer, if any, may be called from
/// several threads at once.
///
/// @return One entry per document: nullopt on success, else the error.
auto apply_patch_batch(std::span<Json> docs, const Patch& patch,
                       const ApplyOptions& options = {})
    -> std::vector<std::optional<Error>>;

}  // namespace jsonmerge_cpp
