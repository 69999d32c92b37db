#include <jsonpatch-cpp/error.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <utility>

namespace jsonpatch_cpp {

auto to_string(const ForbiddenPathViolation& violation) -> std::string {
    // The path is rendered as an escaped, double-quoted string.
    const auto quoted = nlohmann::json(violation.path)
                            .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return "test operation at index: " + std::to_string(violation.index) +
           " contains forbidden path: " + quoted;
}

auto format_violations(std::span<const ForbiddenPathViolation> violations) -> std::string {
    if (violations.size() == 1) {
        return to_string(violations.front());
    }
    auto result = std::string{"["};
    for (std::size_t i = 0; i < violations.size(); ++i) {
        if (i > 0) result += ", ";
        result += to_string(violations[i]);
    }
    result += "]";
    return result;
}

ForbiddenPathError::ForbiddenPathError(std::vector<ForbiddenPathViolation> violations)
    : std::runtime_error{format_violations(violations)},
      violations_{std::move(violations)} {}

}  // namespace jsonpatch_cpp
