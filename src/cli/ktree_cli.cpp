#include <ktree/cli/command_registry.h>
#include <ktree/cli/ktree_cli.h>
#include <ktree/storage/entry_store.h>

#include <spdlog/spdlog.h>

#include <cctype>
#include <iostream>
#include <optional>

namespace ktree::cli {

namespace {

std::optional<spdlog::level::level_enum> parseLevel(const std::string& s) {
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

} // namespace

KtreeCLI::KtreeCLI() {
    app_ = std::make_unique<CLI::App>("ktree - knowledge entries linked into a graph");
    app_->require_subcommand(1);

    app_->add_option("--root", rootOverride_,
                     "Knowledge root directory (overrides KTREE_ROOT and core.root)");
    app_->add_option("--config", configPath_, "Config file (default: $KTREE_CONFIG or XDG path)");
    app_->add_flag("-v,--verbose", verbose_, "Enable debug logging");
    app_->add_flag("--json", jsonOutput_, "Print results as JSON");
}

KtreeCLI::~KtreeCLI() = default;

void KtreeCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

void KtreeCLI::registerBuiltinCommands() {
    CommandRegistry::registerAllCommands(this);
}

void KtreeCLI::applyLogLevel() const {
    // Precedence: --verbose > KTREE_LOG_LEVEL > core.log_level > warn
    if (verbose_) {
        spdlog::set_level(spdlog::level::debug);
        return;
    }
    if (auto lvl = parseLevel(config_.logLevel)) {
        spdlog::set_level(*lvl);
    } else {
        spdlog::warn("Unknown log level '{}', using warn", config_.logLevel);
        spdlog::set_level(spdlog::level::warn);
    }
}

Result<app::services::ServiceBundle> KtreeCLI::getServices() {
    if (services_.valid()) {
        return services_;
    }

    app::services::AppContext ctx;
    try {
        ctx.store = storage::makeFileEntryStore(config_.knowledgeRoot);
    } catch (const std::exception& e) {
        return Error{ErrorCode::IOError, e.what()};
    }

    subscribers_ = std::make_shared<events::SubscriberRegistry>();
    subscribers_->add(std::make_shared<events::LogSubscriber>());
    ctx.notifier = subscribers_;
    ctx.config = config_;

    services_ = app::services::makeServices(ctx);
    if (!services_.valid()) {
        return Error{ErrorCode::InternalError, "Failed to initialize services"};
    }
    return services_;
}

int KtreeCLI::run(int argc, char* argv[]) {
    try {
        registerBuiltinCommands();
        app_->parse(argc, argv);

        config_ = config::loadEngineConfig({configPath_, rootOverride_, ""});
        applyLogLevel();

        if (!pendingCommand_) {
            return 0;
        }
        auto result = pendingCommand_->execute();
        if (!result) {
            spdlog::debug("{} failed: {}", pendingCommand_->getName(), result.error().code);
            std::cerr << "[FAIL] " << result.error().describe() << "\n";
            return 1;
        }
        return 0;
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    } catch (const std::exception& e) {
        // Always provide a user-facing error even if logging is off
        std::cerr << "[FAIL] Unexpected error: " << e.what() << "\n";
        spdlog::error("Unexpected error: {}", e.what());
        return 1;
    }
}

} // namespace ktree::cli
