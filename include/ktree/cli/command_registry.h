#pragma once

#include <ktree/cli/command.h>

#include <memory>

namespace ktree::cli {

// Forward declaration
class KtreeCLI;

/**
 * Registry of all available CLI commands
 */
class CommandRegistry {
public:
    /**
     * Register all built-in commands with the CLI
     */
    static void registerAllCommands(KtreeCLI* cli);

    static std::unique_ptr<ICommand> createAddCommand();
    static std::unique_ptr<ICommand> createUpdateCommand();
    static std::unique_ptr<ICommand> createDeleteCommand();
    static std::unique_ptr<ICommand> createMoveCommand();
    static std::unique_ptr<ICommand> createLinkCommand();
    static std::unique_ptr<ICommand> createGetCommand();
    static std::unique_ptr<ICommand> createListCommand();
    static std::unique_ptr<ICommand> createValidateCommand();
    static std::unique_ptr<ICommand> createStatsCommand();
    static std::unique_ptr<ICommand> createRecentCommand();
};

} // namespace ktree::cli
