#include <jsonpatch-cpp/forbidden_paths.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace jsonpatch_cpp;

TEST(ForbiddenPaths, default_set_holds_resource_version) {
    const auto& defaults = default_forbidden_paths();

    EXPECT_EQ(defaults.size(), 1u);
    EXPECT_TRUE(defaults.contains("/metadata/resourceVersion"));
    EXPECT_TRUE(defaults.contains(resource_version_path));
}

TEST(ForbiddenPaths, default_set_is_a_single_instance) {
    EXPECT_EQ(&default_forbidden_paths(), &default_forbidden_paths());
}

TEST(ForbiddenPaths, contains_is_exact) {
    const auto& defaults = default_forbidden_paths();

    EXPECT_FALSE(defaults.contains("/metadata"));
    EXPECT_FALSE(defaults.contains("/metadata/resourceVersion/x"));
    EXPECT_FALSE(defaults.contains("/metadata/resourceversion"));
    EXPECT_FALSE(defaults.contains(""));
}

TEST(ForbiddenPaths, empty_set_forbids_nothing) {
    const auto none = ForbiddenPaths{};

    EXPECT_TRUE(none.empty());
    EXPECT_FALSE(none.contains("/metadata/resourceVersion"));
}

TEST(ForbiddenPaths, constructed_from_vector_deduplicates_and_sorts) {
    const auto paths = ForbiddenPaths{std::vector<std::string>{"/b", "/a", "/b"}};

    EXPECT_EQ(paths.size(), 2u);
    EXPECT_EQ(paths.paths(), (std::vector<std::string>{"/a", "/b"}));
}

TEST(ForbiddenPaths, equality) {
    EXPECT_EQ((ForbiddenPaths{"/a", "/b"}), (ForbiddenPaths{"/b", "/a"}));
    EXPECT_NE((ForbiddenPaths{"/a"}), (ForbiddenPaths{"/b"}));
}
