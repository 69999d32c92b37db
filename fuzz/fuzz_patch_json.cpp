// Fuzz target for patch JSON — parses arbitrary bytes as a patch array,
// rebuilds it through PatchSet and checks that marshal() either rejects
// it or re-emits an equivalent document.

#include <jsonpatch-cpp/jsonpatch.hpp>
#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    auto doc = nlohmann::json::parse(data, data + size, nullptr, false);
    if (doc.is_discarded() || !doc.is_array()) return 0;

    auto patch = jsonpatch_cpp::PatchSet{};
    try {
        for (const auto& entry : doc) {
            patch.with_operation(entry.get<jsonpatch_cpp::Operation>());
        }
    } catch (const nlohmann::json::exception&) {
        return 0;
    } catch (const std::runtime_error&) {
        return 0;
    }

    const auto violations = patch.validate();
    try {
        auto bytes = patch.marshal();
        if (!violations.empty()) std::abort();
        auto reparsed = nlohmann::json::parse(bytes);
        if (patch.is_empty() != reparsed.is_null()) std::abort();
    } catch (const jsonpatch_cpp::ForbiddenPathError& e) {
        if (e.violations() != violations) std::abort();
    }
    return 0;
}
