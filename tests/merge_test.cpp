#include <jsonpatch-cpp/patch_set.hpp>

#include <gtest/gtest.h>

#include <span>
#include <string>
#include <vector>

using namespace jsonpatch_cpp;

namespace {

auto guarded_remove(const std::string& path, const std::string& value) -> PatchSet {
    auto patch = PatchSet{};
    patch.with_remove(path, new_test_condition(path, value));
    return patch;
}

}  // namespace

TEST(Merge, no_arguments_yields_null) {
    EXPECT_TRUE(merge().is_empty());
    EXPECT_EQ(merge().marshal(), "null");
}

TEST(Merge, empty_span_yields_null) {
    const auto sets = std::vector<PatchSet>{};
    EXPECT_EQ(merge(sets).marshal(), "null");
    EXPECT_EQ(merge(std::span<const PatchSet>{}).marshal(), "null");
}

TEST(Merge, one_empty_patch_yields_null) {
    const auto sets = std::vector<PatchSet>{PatchSet{}};
    EXPECT_EQ(merge(sets).marshal(), "null");
    EXPECT_EQ(merge(PatchSet{}).marshal(), "null");
}

TEST(Merge, one_patch) {
    const auto sets = std::vector<PatchSet>{guarded_remove("/path1", "value1")};
    EXPECT_EQ(merge(sets).marshal(),
              R"([{"op":"test","path":"/path1","value":"value1"},)"
              R"({"op":"remove","path":"/path1"}])");
}

TEST(Merge, multiple_patches_keep_argument_order) {
    const auto a = guarded_remove("/path1", "value1");
    const auto b = guarded_remove("/path2", "value2");
    const auto expected = std::string{
        R"([{"op":"test","path":"/path1","value":"value1"},)"
        R"({"op":"remove","path":"/path1"},)"
        R"({"op":"test","path":"/path2","value":"value2"},)"
        R"({"op":"remove","path":"/path2"}])"};

    EXPECT_EQ(merge(a, b).marshal(), expected);
    EXPECT_EQ(merge(std::vector<PatchSet>{a, b}).marshal(), expected);
}

TEST(Merge, empty_patches_are_skipped) {
    const auto sets = std::vector<PatchSet>{
        PatchSet{},
        guarded_remove("/path1", "value1"),
        PatchSet{},
        guarded_remove("/path2", "value2"),
        PatchSet{},
    };
    EXPECT_EQ(merge(sets).marshal(),
              R"([{"op":"test","path":"/path1","value":"value1"},)"
              R"({"op":"remove","path":"/path1"},)"
              R"({"op":"test","path":"/path2","value":"value2"},)"
              R"({"op":"remove","path":"/path2"}])");
}

TEST(Merge, inputs_are_not_modified) {
    const auto a = guarded_remove("/path1", "value1");
    const auto b = guarded_remove("/path2", "value2");
    const auto a_before = a;
    const auto b_before = b;

    const auto merged = merge(a, b);

    EXPECT_EQ(merged.size(), 4u);
    EXPECT_EQ(a, a_before);
    EXPECT_EQ(b, b_before);
}

TEST(Merge, does_not_deduplicate) {
    const auto a = guarded_remove("/path1", "value1");
    const auto merged = merge(a, a);

    ASSERT_EQ(merged.size(), 4u);
    EXPECT_EQ(merged.operations()[0], merged.operations()[2]);
    EXPECT_EQ(merged.operations()[1], merged.operations()[3]);
}

TEST(Merge, validation_runs_on_merged_result) {
    auto a = PatchSet{};
    a.with_test("/status/ok", true);
    auto b = PatchSet{};
    b.with_test("/metadata/resourceVersion", "9");

    const auto merged = merge(a, b);
    try {
        (void)merged.marshal();
        FAIL() << "expected ForbiddenPathError";
    } catch (const ForbiddenPathError& e) {
        EXPECT_EQ(e.violations(), (std::vector<ForbiddenPathViolation>{
            {1, "/metadata/resourceVersion"},
        }));
    }
}
