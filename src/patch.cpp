#include <jsonmerge-cpp/patch.hpp>

#include <jsonmerge-cpp/engine.hpp>
#include <jsonmerge-cpp/error.hpp>

namespace jsonmerge_cpp {

namespace {

auto parse_bytes(std::string_view bytes, std::string_view what) -> Json {
    try {
        return Json::parse(bytes);
    } catch (const nlohmann::json::parse_error& e) {
        throw PatchError{ErrorKind::parse_error,
                         "invalid " + std::string{what} + " JSON: " + e.what()};
    }
}

}  // anonymous namespace

auto Patch::decode(std::string_view bytes) -> Patch {
    return from_value(parse_bytes(bytes, "patch"));
}

auto Patch::from_value(const Json& j) -> Patch {
    if (!j.is_array()) {
        throw PatchError{ErrorKind::malformed_patch,
                         std::string{"unexpected patch type: "} + j.type_name()};
    }
    auto ops = std::vector<Operation>{};
    ops.reserve(j.size());
    for (std::size_t i = 0; i < j.size(); ++i) {
        if (!j[i].is_object()) {
            throw PatchError{ErrorKind::malformed_patch,
                             "patch element " + std::to_string(i) + " is a " +
                                 j[i].type_name() + ", not an object"};
        }
        ops.emplace_back(j[i]);
    }
    return Patch{std::move(ops)};
}

auto Patch::to_json() const -> Json {
    auto j = Json::array();
    for (const auto& op : ops_) {
        j.push_back(op.to_json());
    }
    return j;
}

auto Patch::encode(int indent) const -> std::string {
    return to_json().dump(indent);
}

auto Patch::apply(std::string_view doc, const ApplyOptions& options) const -> std::string {
    if (doc.empty()) return std::string{};

    auto parsed = parse_bytes(doc, "document");
    apply_patch(parsed, *this, options);
    return parsed.dump();
}

void Patch::apply(Json& doc, const ApplyOptions& options) const {
    apply_patch(doc, *this, options);
}

void to_json(Json& j, const Patch& patch) {
    j = patch.to_json();
}

void from_json(const Json& j, Patch& patch) {
    patch = Patch::from_value(j);
}

}  // namespace jsonmerge_cpp
