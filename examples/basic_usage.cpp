// basic_usage — demonstrates core jsonmerge-cpp API
//
// Shows decoding a patch, applying it to bytes and to a parsed document,
// handling a failed operation, atomic application, and pointer lookups.
//
// Build: cmake --build build
// Run:   ./build/basic_usage

#include <jsonmerge-cpp/jsonmerge.hpp>

#include <cstdio>
#include <string>

namespace jm = jsonmerge_cpp;

int main() {
    // -- Bytes in, bytes out --------------------------------------------------
    auto patch = jm::Patch::decode(R"([
        { "op": "add", "path": "/baz", "value": "qux" },
        { "op": "add", "path": "/list/1", "value": "b" },
        { "op": "move", "from": "/foo", "path": "/moved" }
    ])");

    auto out = patch.apply(R"({"foo":"bar","list":["a","c"]})");
    std::printf("patched: %s\n", out.c_str());
    std::printf("patch:   %s\n", patch.encode().c_str());

    // -- In place on a parsed document ----------------------------------------
    auto doc = jm::Json::parse(R"({"config":{"port":8080,"hosts":["a"]}})");
    jm::apply_patch(doc, jm::Patch::decode(R"([
        { "op": "replace", "path": "/config/port", "value": 9090 },
        { "op": "copy", "from": "/config/hosts/0", "path": "/config/hosts/-" },
        { "op": "test", "path": "/config/hosts", "value": ["a", "a"] }
    ])"));
    std::printf("document: %s\n", doc.dump(2).c_str());

    if (const auto* port = jm::find(doc, "/config/port")) {
        std::printf("port: %s\n", port->dump().c_str());
    }

    // -- Failure reporting ----------------------------------------------------
    auto failing = jm::Patch::decode(R"([
        { "op": "add", "path": "/config/debug", "value": true },
        { "op": "remove", "path": "/config/missing" }
    ])");

    auto options = jm::ApplyOptions{};
    options.atomic = true;
    try {
        failing.apply(doc, options);
    } catch (const jm::PatchError& e) {
        std::printf("failed: %s\n", e.what());
        std::printf("  kind=%s index=%zu\n",
                    std::string{jm::to_string_view(e.kind())}.c_str(),
                    e.op_index().value_or(0));
    }
    // atomic: the add before the failure was rolled back
    std::printf("debug present: %s\n", jm::find(doc, "/config/debug") ? "yes" : "no");

    return 0;
}
