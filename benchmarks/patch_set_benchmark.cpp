// jsonpatch-cpp benchmarks — measures building, merging and marshalling.

#include <jsonpatch-cpp/jsonpatch.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace jsonpatch_cpp;

static auto make_patch(std::size_t n) -> PatchSet {
    auto patch = PatchSet{};
    for (std::size_t i = 0; i < n; ++i) {
        const auto path = "/status/conditions/" + std::to_string(i);
        patch.with_remove(path, new_test_condition(path + "/type", "Stale"));
    }
    return patch;
}

// =============================================================================
// Building
// =============================================================================

static void bm_build_guarded_removes(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    for (auto _ : state) {
        auto patch = make_patch(n);
        benchmark::DoNotOptimize(patch);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_build_guarded_removes)->Range(1, 1000);

// =============================================================================
// Marshal
// =============================================================================

static void bm_marshal(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto patch = make_patch(n);
    for (auto _ : state) {
        auto bytes = patch.marshal();
        benchmark::DoNotOptimize(bytes);
        state.SetBytesProcessed(static_cast<std::int64_t>(bytes.size()));
    }
}
BENCHMARK(bm_marshal)->Range(1, 1000);

static void bm_validate(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto patch = make_patch(n);
    const auto forbidden = ForbiddenPaths{
        std::string{resource_version_path}, "/metadata/uid", "/metadata/generation"};
    for (auto _ : state) {
        auto violations = patch.validate(forbidden);
        benchmark::DoNotOptimize(violations);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * patch.size()));
}
BENCHMARK(bm_validate)->Range(1, 1000);

static void bm_marshal_rejected(benchmark::State& state) {
    auto patch = make_patch(100);
    patch.with_test(std::string{resource_version_path}, "1");
    for (auto _ : state) {
        try {
            auto bytes = patch.marshal();
            benchmark::DoNotOptimize(bytes);
        } catch (const ForbiddenPathError& e) {
            auto count = e.violations().size();
            benchmark::DoNotOptimize(count);
        }
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_marshal_rejected);

// =============================================================================
// Merge
// =============================================================================

static void bm_merge(benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    auto sets = std::vector<PatchSet>{};
    for (std::size_t i = 0; i < count; ++i) {
        sets.push_back(i % 3 == 0 ? PatchSet{} : make_patch(10));
    }
    for (auto _ : state) {
        auto merged = merge(sets);
        benchmark::DoNotOptimize(merged);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * count));
}
BENCHMARK(bm_merge)->Range(1, 256);
