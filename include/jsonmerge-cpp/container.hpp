/// @file container.hpp
/// @brief Token-keyed access to JSON objects and arrays.
///
/// Every patch operation is written once against "a container and a key".
/// The key is a member name for objects and a decimal index (or the "-"
/// append sentinel) for arrays. Containers are non-owning views and must
/// not outlive the value they wrap.

#pragma once

#include <jsonmerge-cpp/value.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace jsonmerge_cpp {

/// A view over a JSON object.
class ObjectContainer {
public:
    /// @param obj Must hold an object.
    explicit ObjectContainer(Json& obj) : obj_{&obj} {}

    /// The member at `key`.
    /// @throws PatchError (path_not_found) if absent.
    auto get(std::string_view key) const -> Json&;

    /// Insert or overwrite. New keys go last; an overwrite keeps its position.
    void set(std::string_view key, Json value);

    /// Same as set: add on an object is an upsert.
    void add(std::string_view key, Json value) { set(key, std::move(value)); }

    /// Delete the member at `key`.
    /// @throws PatchError (path_not_found) if absent.
    void remove(std::string_view key);

    /// Zero-based position of `key` in member order.
    /// @throws PatchError (path_not_found) if absent.
    auto position(std::string_view key) const -> std::size_t;

    /// Insert `key` so it lands at `position` in member order (last if
    /// `position` is past the end). An existing `key` is replaced.
    void insert(std::size_t position, std::string_view key, Json value);

    auto value() const -> Json& { return *obj_; }

private:
    Json* obj_;
};

/// A view over a JSON array.
class ArrayContainer {
public:
    /// The token meaning "after the last element".
    static constexpr std::string_view append_token = "-";

    /// @param arr Must hold an array.
    explicit ArrayContainer(Json& arr) : arr_{&arr} {}

    /// Parse an index token: decimal digits only, no sign, no leading zeros.
    /// @return nullopt for anything else, including "-" and overflow.
    static auto try_parse_index(std::string_view token) noexcept -> std::optional<std::size_t>;

    /// As try_parse_index().
    /// @throws PatchError (invalid_index) where try_parse_index() gives nullopt.
    static auto parse_index(std::string_view token) -> std::size_t;

    /// The element at `token`. Requires index < size.
    auto get(std::string_view token) const -> Json&;

    /// Replace the element at `token`. Requires index < size.
    void set(std::string_view token, Json value);

    /// The position add() would insert at: size() for "-", else the index.
    /// @throws PatchError (invalid_index) if the token is malformed or past size().
    auto insert_index(std::string_view token) const -> std::size_t;

    /// Insert before `token`, shifting later elements right.
    /// Accepts index <= size and the "-" sentinel.
    void add(std::string_view token, Json value);

    /// Delete the element at `token`, shifting later elements left.
    void remove(std::string_view token);

    auto size() const -> std::size_t { return arr_->size(); }
    auto value() const -> Json& { return *arr_; }

private:
    auto checked_index(std::string_view token) const -> std::size_t;

    Json* arr_;
};

/// The closed set of containers: JSON has exactly these two.
using Container = std::variant<ObjectContainer, ArrayContainer>;

/// Wrap a value in the matching container, or nullopt for a scalar.
auto make_container(Json& value) -> std::optional<Container>;

auto get(const Container& c, std::string_view key) -> Json&;
void set(Container& c, std::string_view key, Json value);
void add(Container& c, std::string_view key, Json value);
void remove(Container& c, std::string_view key);

/// True if `key` currently names a member or element.
/// @throws PatchError (invalid_index) for a malformed array token.
auto contains(const Container& c, std::string_view key) -> bool;

/// Throw the error add() would raise for `key`, without mutating.
/// Only arrays can reject an add; for an object this never throws.
void check_add(const Container& c, std::string_view key);

/// The wrapped value, whichever variant is active.
auto container_value(const Container& c) -> Json&;

}  // namespace jsonmerge_cpp
