#include <jsonmerge-cpp/container.hpp>

#include <jsonmerge-cpp/error.hpp>

#include <charconv>
#include <cstddef>
#include <string>
#include <system_error>
#include <variant>

namespace jsonmerge_cpp {

// =============================================================================
// ObjectContainer
// =============================================================================

auto ObjectContainer::get(std::string_view key) const -> Json& {
    auto it = obj_->find(std::string{key});
    if (it == obj_->end()) {
        throw PatchError{ErrorKind::path_not_found, "missing key " + std::string{key}};
    }
    return *it;
}

void ObjectContainer::set(std::string_view key, Json value) {
    (*obj_)[std::string{key}] = std::move(value);
}

void ObjectContainer::remove(std::string_view key) {
    if (obj_->erase(std::string{key}) == 0) {
        throw PatchError{ErrorKind::path_not_found, "missing key " + std::string{key}};
    }
}

auto ObjectContainer::position(std::string_view key) const -> std::size_t {
    auto pos = std::size_t{0};
    for (auto it = obj_->begin(); it != obj_->end(); ++it, ++pos) {
        if (it.key() == key) return pos;
    }
    throw PatchError{ErrorKind::path_not_found, "missing key " + std::string{key}};
}

void ObjectContainer::insert(std::size_t position, std::string_view key, Json value) {
    // ordered_json has no positional insert, so rebuild the member list
    auto rebuilt = Json::object();
    auto pos = std::size_t{0};
    auto placed = false;
    for (auto it = obj_->begin(); it != obj_->end(); ++it, ++pos) {
        if (pos == position) {
            rebuilt[std::string{key}] = std::move(value);
            placed = true;
        }
        if (it.key() != key) rebuilt[it.key()] = std::move(*it);
    }
    if (!placed) rebuilt[std::string{key}] = std::move(value);
    *obj_ = std::move(rebuilt);
}

// =============================================================================
// ArrayContainer
// =============================================================================

auto ArrayContainer::try_parse_index(std::string_view token) noexcept -> std::optional<std::size_t> {
    // Leading zeros are not allowed per RFC 6901 (except "0" itself)
    if (token.empty() || (token.size() > 1 && token[0] == '0')) return std::nullopt;
    auto result = std::size_t{0};
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), result);
    if (ec != std::errc{} || ptr != token.data() + token.size()) return std::nullopt;
    return result;
}

auto ArrayContainer::parse_index(std::string_view token) -> std::size_t {
    if (auto idx = try_parse_index(token)) return *idx;
    throw PatchError{ErrorKind::invalid_index, "invalid array index '" + std::string{token} + "'"};
}

auto ArrayContainer::checked_index(std::string_view token) const -> std::size_t {
    auto idx = parse_index(token);
    if (idx >= arr_->size()) {
        throw PatchError{ErrorKind::invalid_index,
                         "index " + std::to_string(idx) + " out of bounds for array of size " +
                             std::to_string(arr_->size())};
    }
    return idx;
}

auto ArrayContainer::get(std::string_view token) const -> Json& {
    return (*arr_)[checked_index(token)];
}

void ArrayContainer::set(std::string_view token, Json value) {
    if (token == append_token) {
        throw PatchError{ErrorKind::invalid_index,
                         "index " + std::to_string(arr_->size()) + " out of bounds for array of size " +
                             std::to_string(arr_->size())};
    }
    (*arr_)[checked_index(token)] = std::move(value);
}

auto ArrayContainer::insert_index(std::string_view token) const -> std::size_t {
    if (token == append_token) return arr_->size();
    auto idx = parse_index(token);
    if (idx > arr_->size()) {
        throw PatchError{ErrorKind::invalid_index,
                         "insert index " + std::to_string(idx) + " past end of array of size " +
                             std::to_string(arr_->size())};
    }
    return idx;
}

void ArrayContainer::add(std::string_view token, Json value) {
    auto idx = insert_index(token);
    arr_->insert(arr_->begin() + static_cast<std::ptrdiff_t>(idx), std::move(value));
}

void ArrayContainer::remove(std::string_view token) {
    arr_->erase(checked_index(token));
}

// =============================================================================
// Variant dispatch
// =============================================================================

auto make_container(Json& value) -> std::optional<Container> {
    switch (type_of(value)) {
        case ValueType::object: return Container{ObjectContainer{value}};
        case ValueType::array:  return Container{ArrayContainer{value}};
        case ValueType::scalar: return std::nullopt;
    }
    return std::nullopt;
}

auto get(const Container& c, std::string_view key) -> Json& {
    return std::visit([&](const auto& con) -> Json& { return con.get(key); }, c);
}

void set(Container& c, std::string_view key, Json value) {
    std::visit([&](auto& con) { con.set(key, std::move(value)); }, c);
}

void add(Container& c, std::string_view key, Json value) {
    std::visit([&](auto& con) { con.add(key, std::move(value)); }, c);
}

void remove(Container& c, std::string_view key) {
    std::visit([&](auto& con) { con.remove(key); }, c);
}

auto contains(const Container& c, std::string_view key) -> bool {
    return std::visit(overload{
        [&](const ObjectContainer& obj) { return obj.value().contains(std::string{key}); },
        [&](const ArrayContainer& arr) { return ArrayContainer::parse_index(key) < arr.size(); },
    }, c);
}

void check_add(const Container& c, std::string_view key) {
    if (const auto* arr = std::get_if<ArrayContainer>(&c)) {
        arr->insert_index(key);
    }
}

auto container_value(const Container& c) -> Json& {
    return std::visit([](const auto& con) -> Json& { return con.value(); }, c);
}

}  // namespace jsonmerge_cpp
