// Fuzz target for JSON Pointer parsing and lookup — exercises token
// unescaping, array index parsing and the escape round-trip.

#include <jsonmerge-cpp/jsonmerge.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view(reinterpret_cast<const char*>(data), size);

    static const auto doc = jsonmerge_cpp::Json::parse(
        R"({"a":{"b":[1,2,{"c~d":null,"e/f":[true]}]},"":{"":0}})");

    (void)jsonmerge_cpp::find(doc, text);

    try {
        auto pointer = jsonmerge_cpp::Pointer::parse(text);
        // Escaped tokens must parse back to the same pointer
        auto again = jsonmerge_cpp::Pointer::parse(pointer.to_string());
        if (!(again == pointer)) __builtin_trap();

        for (const auto& token : pointer.tokens()) {
            try {
                (void)jsonmerge_cpp::ArrayContainer::parse_index(token);
            } catch (const jsonmerge_cpp::PatchError&) {
            }
        }
    } catch (const jsonmerge_cpp::PatchError&) {
    }
    return 0;
}
