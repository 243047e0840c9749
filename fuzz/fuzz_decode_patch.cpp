// Fuzz target for Patch::decode() — exercises patch parsing and operation
// field validation. Any decoded patch is round-tripped through encode().

#include <jsonmerge-cpp/jsonmerge.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto bytes = std::string_view(reinterpret_cast<const char*>(data), size);

    try {
        auto patch = jsonmerge_cpp::Patch::decode(bytes);
        for (const auto& op : patch) {
            (void)op.type();
            (void)op.string_field("path");
            (void)op.string_field("from");
        }
        // Round-trip: a decoded patch must encode and decode back to itself
        auto again = jsonmerge_cpp::Patch::decode(patch.encode());
        if (!(again == patch)) __builtin_trap();
    } catch (const jsonmerge_cpp::PatchError&) {
    }
    return 0;
}
