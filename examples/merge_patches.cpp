// merge_patches — combine patches built by independent code paths
//
// Each controller step contributes its own guarded operations; the
// results are merged in order and validated once.
//
// Build: cmake --build build
// Run:   ./build/examples/merge_patches [forbidden-paths.json]

#include <jsonpatch-cpp/jsonpatch.hpp>
#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdio>
#include <exception>
#include <fstream>
#include <string>
#include <vector>

namespace jp = jsonpatch_cpp;
using json = nlohmann::json;

// Drop a stale condition, guarded on its type still matching.
static auto drop_condition(std::size_t index, const std::string& type) -> jp::PatchSet {
    const auto base = "/status/conditions/" + std::to_string(index);
    auto patch = jp::PatchSet{};
    patch.with_remove(base, jp::new_test_condition(base + "/type", type));
    return patch;
}

// Load a forbidden-path set from a JSON array file, or fall back to the default.
static auto load_forbidden(int argc, char** argv) -> jp::ForbiddenPaths {
    if (argc < 2) return jp::default_forbidden_paths();
    auto in = std::ifstream{argv[1]};
    if (!in) {
        std::fprintf(stderr, "cannot open %s, using defaults\n", argv[1]);
        return jp::default_forbidden_paths();
    }
    return json::parse(in).get<jp::ForbiddenPaths>();
}

int main(int argc, char** argv) {
    auto forbidden = jp::ForbiddenPaths{};
    try {
        forbidden = load_forbidden(argc, argv);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "invalid forbidden-path config: %s\n", e.what());
        return 2;
    }
    std::printf("forbidden paths: %s\n", json(forbidden).dump().c_str());

    auto steps = std::vector<jp::PatchSet>{};
    steps.push_back(drop_condition(2, "Degraded"));
    steps.push_back(jp::PatchSet{});  // a step with nothing to do
    steps.push_back(drop_condition(0, "Progressing"));

    const auto merged = jp::merge(steps);
    std::printf("%zu operations from %zu steps\n", merged.size(), steps.size());

    try {
        std::printf("%s\n", merged.marshal(forbidden).c_str());
    } catch (const jp::ForbiddenPathError& e) {
        std::fprintf(stderr, "patch rejected: %s\n", e.what());
        return 1;
    }
    return 0;
}
