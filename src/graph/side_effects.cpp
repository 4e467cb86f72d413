#include <ktree/graph/side_effects.h>

#include <spdlog/fmt/fmt.h>

namespace ktree::graph {

std::optional<Error> SideEffectReport::asPartialFailure(const std::string& what) const {
    if (failures.empty()) {
        return std::nullopt;
    }
    std::vector<std::string> details;
    details.reserve(failures.size());
    for (const auto& f : failures) {
        details.push_back(fmt::format("{}: {}", f.path, f.error.describe()));
    }
    return Error{ErrorCode::PartialFailure,
                 fmt::format("{} incomplete: {} of {} entries failed", what, failures.size(),
                             attempted),
                 std::move(details)};
}

std::vector<std::string> SideEffectReport::warnings(const std::string& what) const {
    std::vector<std::string> out;
    out.reserve(failures.size());
    for (const auto& f : failures) {
        out.push_back(fmt::format("{} failed for {}: {}", what, f.path, f.error.describe()));
    }
    return out;
}

} // namespace ktree::graph
