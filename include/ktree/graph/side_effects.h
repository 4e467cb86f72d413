#pragma once

#include <ktree/core/types.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace ktree::graph {

// One entry a best-effort side effect could not be applied to
struct SideEffectFailure {
    std::string path;
    Error error;
};

/**
 * Outcome of a best-effort side effect (mirror sync, reference rewrite) across many entries.
 * Failures never fail the primary mutation; they are surfaced here instead.
 */
struct SideEffectReport {
    std::size_t attempted{0}; // candidate entries considered
    std::size_t modified{0};  // entries successfully rewritten
    std::vector<SideEffectFailure> failures;

    bool complete() const noexcept { return failures.empty(); }

    void fail(std::string path, Error error) {
        failures.push_back({std::move(path), std::move(error)});
    }

    // ErrorCode::PartialFailure summary when at least one entry failed
    std::optional<Error> asPartialFailure(const std::string& what) const;

    // One human readable line per failure, prefixed with `what`
    std::vector<std::string> warnings(const std::string& what) const;
};

} // namespace ktree::graph
