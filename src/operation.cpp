#include <jsonmerge-cpp/operation.hpp>

#include <jsonmerge-cpp/error.hpp>

#include <string>
#include <utility>

namespace jsonmerge_cpp {

Operation::Operation(Json obj) : obj_{std::move(obj)} {
    if (!obj_.is_object()) {
        throw PatchError{ErrorKind::malformed_patch,
                         std::string{"patch operation must be an object, got "} + obj_.type_name()};
    }
}

auto Operation::string_field(std::string_view key) const -> std::optional<std::string> {
    auto it = obj_.find(std::string{key});
    if (it == obj_.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

auto Operation::kind() const -> std::string {
    if (auto op = string_field("op")) return *op;
    return std::string{to_string_view(OpType::unknown)};
}

auto Operation::path() const -> std::string {
    if (auto path = string_field("path")) return *path;
    throw PatchError{ErrorKind::missing_field, kind() + " operation has no string \"path\" field"};
}

auto Operation::from() const -> std::string {
    if (auto from = string_field("from")) return *from;
    throw PatchError{ErrorKind::missing_field, kind() + " operation has no string \"from\" field"};
}

auto Operation::value() const -> const Json& {
    auto it = obj_.find(std::string{"value"});
    if (it == obj_.end()) {
        throw PatchError{ErrorKind::missing_field, kind() + " operation has no \"value\" field"};
    }
    return *it;
}

void to_json(Json& j, const Operation& op) {
    j = op.to_json();
}

}  // namespace jsonmerge_cpp
