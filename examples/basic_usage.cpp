// basic_usage — demonstrates core jsonpatch-cpp API
//
// Builds a guarded patch, marshals it, and shows how a forbidden
// resourceVersion test is reported.
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage

#include <jsonpatch-cpp/jsonpatch.hpp>

#include <cstdio>
#include <string>

namespace jp = jsonpatch_cpp;

int main() {
    // -- Empty patch ----------------------------------------------------------
    auto empty = jp::PatchSet{};
    std::printf("empty patch:    %s\n", empty.marshal().c_str());

    // -- Guarded remove: the test is emitted before the remove ----------------
    auto patch = jp::PatchSet{};
    patch.with_test("/status/phase", "Running")
         .with_remove("/status/conditions/0",
                      jp::new_test_condition("/status/conditions/0/type", "Stale"))
         .with_replace("/spec/replicas", 3);
    std::printf("guarded patch:  %s\n", patch.marshal().c_str());

    // -- Forbidden path: every violation is collected -------------------------
    auto bad = jp::PatchSet{};
    bad.with_test("/metadata/resourceVersion", "41")
       .with_test("/status/phase", "Running")
       .with_test("/metadata/resourceVersion", "42");
    try {
        auto body = bad.marshal();
        std::printf("unexpected output: %s\n", body.c_str());
        return 1;
    } catch (const jp::ForbiddenPathError& e) {
        std::printf("rejected:       %s\n", e.what());
        for (const auto& v : e.violations()) {
            std::printf("  index %zu -> %s\n", v.index, v.path.c_str());
        }
    }

    // -- Alternate forbidden set ----------------------------------------------
    const auto strict = jp::ForbiddenPaths{
        std::string{jp::resource_version_path}, "/metadata/generation"};
    auto gen = jp::PatchSet{};
    gen.with_test("/metadata/generation", 7);
    const auto violations = gen.validate(strict);
    std::printf("strict check:   %zu violation(s): %s\n",
                violations.size(), jp::format_violations(violations).c_str());

    return 0;
}
