#include <ktree/app/services/factory.hpp>

namespace ktree::app::services {

// Compose the bundle from the individual factories (entry, validation and stats services)
ServiceBundle makeServices(const AppContext& ctx) {
    ServiceBundle bundle;
    bundle.entries = makeEntryService(ctx);
    bundle.validation = makeValidationService(ctx);
    bundle.stats = makeStatsService(ctx);
    return bundle;
}

} // namespace ktree::app::services
