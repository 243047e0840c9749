/// @file patch.hpp
/// @brief An ordered list of JSON Patch operations with decode/encode.

#pragma once

#include <jsonmerge-cpp/operation.hpp>
#include <jsonmerge-cpp/options.hpp>
#include <jsonmerge-cpp/value.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jsonmerge_cpp {

/// A JSON Patch document: operations applied strictly in order.
///
/// @code
/// auto patch = Patch::decode(R"([{"op":"add","path":"/baz","value":"qux"}])");
/// auto out = patch.apply(R"({"foo":"bar"})");  // {"foo":"bar","baz":"qux"}
/// @endcode
class Patch {
public:
    Patch() = default;

    explicit Patch(std::vector<Operation> ops) : ops_{std::move(ops)} {}

    /// Parse patch bytes.
    /// @throws PatchError (parse_error) for invalid JSON.
    /// @throws PatchError (malformed_patch) if not an array of objects.
    static auto decode(std::string_view bytes) -> Patch;

    /// Build from an already-parsed JSON value.
    /// @throws PatchError (malformed_patch) if not an array of objects.
    static auto from_value(const Json& j) -> Patch;

    /// Serialize as a JSON array, preserving order and every original field.
    auto encode(int indent = -1) const -> std::string;

    /// The patch as a JSON array.
    auto to_json() const -> Json;

    /// Apply to a serialized document and return the serialized result.
    ///
    /// Empty input is returned unchanged without being parsed.
    /// @throws PatchError (parse_error) for an unparseable document, or the
    ///   error of the first failing operation.
    auto apply(std::string_view doc, const ApplyOptions& options = {}) const -> std::string;

    /// Apply in place. See apply_patch().
    void apply(Json& doc, const ApplyOptions& options = {}) const;

    auto operations() const -> const std::vector<Operation>& { return ops_; }
    auto size() const -> std::size_t { return ops_.size(); }
    auto empty() const -> bool { return ops_.empty(); }
    auto operator[](std::size_t i) const -> const Operation& { return ops_[i]; }

    auto begin() const { return ops_.begin(); }
    auto end() const { return ops_.end(); }

    void push_back(Operation op) { ops_.push_back(std::move(op)); }

    auto operator==(const Patch&) const -> bool = default;

private:
    std::vector<Operation> ops_;
};

/// ADL serialization: `Json j = patch;` and `j.get<Patch>()`.
void to_json(Json& j, const Patch& patch);
void from_json(const Json& j, Patch& patch);

}  // namespace jsonmerge_cpp
