#include <jsonmerge-cpp/resolver.hpp>

#include <jsonmerge-cpp/error.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace jsonmerge_cpp {

namespace {

auto missing_path(const Pointer& pointer, std::size_t depth, std::string_view reason) -> PatchError {
    auto walked = Pointer{std::vector<std::string>(
        pointer.tokens().begin(),
        pointer.tokens().begin() + static_cast<std::ptrdiff_t>(depth + 1))};
    return PatchError{ErrorKind::path_not_found,
                      "path " + walked.to_string() + " " + std::string{reason}};
}

/// One descent step: the child of `current` at `token`, or nullptr.
auto child_of(Container& current, const std::string& token) -> Json* {
    return std::visit(overload{
        [&](ObjectContainer& obj) -> Json* {
            auto& v = obj.value();
            auto it = v.find(token);
            return it == v.end() ? nullptr : &*it;
        },
        [&](ArrayContainer& arr) -> Json* {
            auto idx = ArrayContainer::parse_index(token);
            if (idx >= arr.size()) return nullptr;
            return &arr.value()[idx];
        },
    }, current);
}

}  // anonymous namespace

auto resolve(Json& root, const Pointer& pointer) -> Target {
    if (pointer.empty()) {
        throw PatchError{ErrorKind::path_not_found, "root pointer has no parent container"};
    }
    auto current = make_container(root);
    if (!current) {
        throw PatchError{ErrorKind::path_not_found,
                         "document root is a " + std::string{to_string_view(type_of(root))} +
                             ", not a container"};
    }

    const auto& tokens = pointer.tokens();
    for (std::size_t i = 0; i + 1 < tokens.size(); ++i) {
        auto* next = child_of(*current, tokens[i]);
        if (next == nullptr) throw missing_path(pointer, i, "does not exist");
        current = make_container(*next);
        if (!current) throw missing_path(pointer, i, "is not an object or array");
    }
    return Target{std::move(*current), pointer.back()};
}

auto value_at(Json& root, const Pointer& pointer) -> Json& {
    if (pointer.empty()) return root;
    auto target = resolve(root, pointer);
    return get(target.parent, target.key);
}

auto find(const Json& root, std::string_view pointer) -> const Json* {
    if (!pointer.empty() && pointer[0] != '/') return nullptr;
    auto parsed = Pointer::parse(pointer);

    const auto* current = &root;
    for (const auto& token : parsed.tokens()) {
        if (current->is_object()) {
            auto it = current->find(token);
            if (it == current->end()) return nullptr;
            current = &*it;
        } else if (current->is_array()) {
            auto idx = ArrayContainer::try_parse_index(token);
            if (!idx || *idx >= current->size()) return nullptr;
            current = &(*current)[*idx];
        } else {
            return nullptr;
        }
    }
    return current;
}

}  // namespace jsonmerge_cpp
