#pragma once

/**
 * Service Factory: constructs the entry, validation and stats services from a shared AppContext.
 *
 * ctx.store is required; ctx.notifier may be null, in which case change notifications are
 * dropped.
 */

#include <ktree/app/services/services.hpp>

#include <memory>

namespace ktree::app::services {

struct ServiceBundle {
    std::shared_ptr<IEntryService> entries;
    std::shared_ptr<IValidationService> validation;
    std::shared_ptr<IStatsService> stats;

    // True if all services are non-null.
    [[nodiscard]] bool valid() const noexcept {
        return static_cast<bool>(entries) && static_cast<bool>(validation) &&
               static_cast<bool>(stats);
    }
};

[[nodiscard]] ServiceBundle makeServices(const AppContext& ctx);

// These return nullptr when ctx.store is missing.
[[nodiscard]] std::shared_ptr<IEntryService> makeEntryService(const AppContext& ctx);
[[nodiscard]] std::shared_ptr<IValidationService> makeValidationService(const AppContext& ctx);
[[nodiscard]] std::shared_ptr<IStatsService> makeStatsService(const AppContext& ctx);

} // namespace ktree::app::services
