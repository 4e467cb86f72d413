#include <ktree/cli/command_registry.h>
#include <ktree/cli/ktree_cli.h>

namespace ktree::cli {

// External factory functions from command implementations (in this namespace)
std::unique_ptr<ICommand> createAddCommand();
std::unique_ptr<ICommand> createUpdateCommand();
std::unique_ptr<ICommand> createDeleteCommand();
std::unique_ptr<ICommand> createMoveCommand();
std::unique_ptr<ICommand> createLinkCommand();
std::unique_ptr<ICommand> createGetCommand();
std::unique_ptr<ICommand> createListCommand();
std::unique_ptr<ICommand> createValidateCommand();
std::unique_ptr<ICommand> createStatsCommand();
std::unique_ptr<ICommand> createRecentCommand();

void CommandRegistry::registerAllCommands(KtreeCLI* cli) {
    cli->registerCommand(CommandRegistry::createAddCommand());
    cli->registerCommand(CommandRegistry::createUpdateCommand());
    cli->registerCommand(CommandRegistry::createDeleteCommand());
    cli->registerCommand(CommandRegistry::createMoveCommand());
    cli->registerCommand(CommandRegistry::createLinkCommand());
    cli->registerCommand(CommandRegistry::createGetCommand());
    cli->registerCommand(CommandRegistry::createListCommand());
    cli->registerCommand(CommandRegistry::createValidateCommand());
    cli->registerCommand(CommandRegistry::createStatsCommand());
    cli->registerCommand(CommandRegistry::createRecentCommand());
}

std::unique_ptr<ICommand> CommandRegistry::createAddCommand() {
    return ::ktree::cli::createAddCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createUpdateCommand() {
    return ::ktree::cli::createUpdateCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createDeleteCommand() {
    return ::ktree::cli::createDeleteCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createMoveCommand() {
    return ::ktree::cli::createMoveCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createLinkCommand() {
    return ::ktree::cli::createLinkCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createGetCommand() {
    return ::ktree::cli::createGetCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createListCommand() {
    return ::ktree::cli::createListCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createValidateCommand() {
    return ::ktree::cli::createValidateCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createStatsCommand() {
    return ::ktree::cli::createStatsCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createRecentCommand() {
    return ::ktree::cli::createRecentCommand();
}

} // namespace ktree::cli
