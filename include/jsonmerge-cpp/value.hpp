/// @file value.hpp
/// @brief The document value type and runtime type classification.

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string_view>

namespace jsonmerge_cpp {

/// A JSON document value. Objects keep their key insertion order.
using Json = nlohmann::ordered_json;

/// How the engine sees a value: something it can descend into, or not.
enum class ValueType : std::uint8_t {
    object,  ///< A JSON object (string-keyed members).
    array,   ///< A JSON array (index-keyed elements).
    scalar,  ///< null, bool, number or string.
};

/// Convert a ValueType to its string representation.
constexpr auto to_string_view(ValueType type) noexcept -> std::string_view {
    switch (type) {
        case ValueType::object: return "object";
        case ValueType::array:  return "array";
        case ValueType::scalar: return "scalar";
    }
    return "unknown";
}

/// Classify a value by its runtime type.
inline auto type_of(const Json& v) noexcept -> ValueType {
    if (v.is_object()) return ValueType::object;
    if (v.is_array()) return ValueType::array;
    return ValueType::scalar;
}

/// Check if a value is an object or array.
inline auto is_container(const Json& v) noexcept -> bool {
    return type_of(v) != ValueType::scalar;
}

/// JSON equality as RFC 6902 "test" defines it.
///
/// Objects are equal when they have the same members, in any order.
/// Arrays compare element-wise. Numbers compare by value, so 1 == 1.0.
auto structurally_equal(const Json& a, const Json& b) -> bool;

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](ObjectContainer& obj) { ... },
///     [](ArrayContainer& arr) { ... },
/// }, container);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace jsonmerge_cpp
