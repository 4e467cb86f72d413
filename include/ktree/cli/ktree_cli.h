#pragma once

#include <ktree/app/services/factory.hpp>
#include <ktree/cli/command.h>
#include <ktree/config/engine_config.h>
#include <ktree/events/change_notifier.h>

#include <CLI/CLI.hpp>

#include <memory>
#include <string>
#include <vector>

namespace ktree::cli {

/**
 * Main CLI application class
 */
class KtreeCLI {
public:
    KtreeCLI();
    ~KtreeCLI();

    /**
     * Run the CLI with given arguments
     */
    int run(int argc, char* argv[]);

    /**
     * Services over the configured knowledge root; initialized on first access
     */
    Result<app::services::ServiceBundle> getServices();

    bool getJsonOutput() const { return jsonOutput_; }

    /**
     * Register a command
     */
    void registerCommand(std::unique_ptr<ICommand> command);

    /**
     * Defer execution of a command until after parsing and configuration
     */
    void setPendingCommand(ICommand* cmd) { pendingCommand_ = cmd; }

private:
    void registerBuiltinCommands();
    void applyLogLevel() const;

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;
    ICommand* pendingCommand_{nullptr};

    // Global options
    std::string rootOverride_;
    std::string configPath_;
    bool verbose_{false};
    bool jsonOutput_{false};

    config::EngineConfig config_;
    std::shared_ptr<events::SubscriberRegistry> subscribers_;
    app::services::ServiceBundle services_;
};

} // namespace ktree::cli
