/// @file operation.hpp
/// @brief A single JSON Patch (RFC 6902) operation.

#pragma once

#include <jsonmerge-cpp/value.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace jsonmerge_cpp {

/// The kind of edit an operation performs.
enum class OpType : std::uint8_t {
    add,      ///< Insert into an array or upsert into an object.
    remove,   ///< Delete an existing member or element.
    replace,  ///< Overwrite an existing member or element.
    move,     ///< Relocate a value from "from" to "path".
    test,     ///< Assert the value at "path" equals "value".
    copy,     ///< Deep-copy the value at "from" to "path".
    unknown,  ///< Missing or unrecognized "op".
};

/// Convert an OpType to its string representation.
constexpr auto to_string_view(OpType type) noexcept -> std::string_view {
    switch (type) {
        case OpType::add:     return "add";
        case OpType::remove:  return "remove";
        case OpType::replace: return "replace";
        case OpType::move:    return "move";
        case OpType::test:    return "test";
        case OpType::copy:    return "copy";
        case OpType::unknown: return "unknown";
    }
    return "unknown";
}

/// Parse an "op" name. Unrecognized names map to OpType::unknown.
constexpr auto op_type_from_string(std::string_view name) noexcept -> OpType {
    if (name == "add")     return OpType::add;
    if (name == "remove")  return OpType::remove;
    if (name == "replace") return OpType::replace;
    if (name == "move")    return OpType::move;
    if (name == "test")    return OpType::test;
    if (name == "copy")    return OpType::copy;
    return OpType::unknown;
}

/// One decoded patch step.
///
/// Keeps the whole JSON object it was decoded from, so encoding gives back
/// every original field. Fields are validated lazily: an accessor for a
/// field the operation lacks throws instead of returning a default.
///
/// @code
/// auto op = Operation{Json{{"op", "add"}, {"path", "/a"}, {"value", 1}}};
/// op.type();   // OpType::add
/// op.path();   // "/a"
/// op.from();   // throws PatchError (missing_field)
/// @endcode
class Operation {
public:
    /// @param obj Must hold an object.
    /// @throws PatchError (malformed_patch) if it does not.
    explicit Operation(Json obj);

    /// The raw "op" string, or "unknown" if absent or not a string.
    auto kind() const -> std::string;

    /// The parsed "op".
    auto type() const -> OpType { return op_type_from_string(kind()); }

    /// @throws PatchError (missing_field) if absent or not a string.
    auto path() const -> std::string;

    /// @throws PatchError (missing_field) if absent or not a string.
    auto from() const -> std::string;

    /// The "value" member, which may legitimately be null.
    /// @throws PatchError (missing_field) if absent.
    auto value() const -> const Json&;

    /// A string member by name, or nullopt if absent or not a string.
    auto string_field(std::string_view key) const -> std::optional<std::string>;

    /// The original JSON object.
    auto to_json() const -> const Json& { return obj_; }

    auto operator==(const Operation&) const -> bool = default;

private:
    Json obj_;
};

/// ADL serialization, so an Operation converts with `Json j = op;`.
void to_json(Json& j, const Operation& op);

}  // namespace jsonmerge_cpp
