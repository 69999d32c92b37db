#include <jsonpatch-cpp/forbidden_paths.hpp>

namespace jsonpatch_cpp {

ForbiddenPaths::ForbiddenPaths(std::initializer_list<std::string> paths)
    : paths_(paths) {}

ForbiddenPaths::ForbiddenPaths(const std::vector<std::string>& paths)
    : paths_(paths.begin(), paths.end()) {}

auto ForbiddenPaths::contains(std::string_view path) const -> bool {
    return paths_.find(path) != paths_.end();
}

auto ForbiddenPaths::paths() const -> std::vector<std::string> {
    return std::vector<std::string>(paths_.begin(), paths_.end());
}

auto default_forbidden_paths() -> const ForbiddenPaths& {
    static const auto defaults = ForbiddenPaths{std::string{resource_version_path}};
    return defaults;
}

}  // namespace jsonpatch_cpp
