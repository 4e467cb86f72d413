#include <ktree/cli/cli_output.h>
#include <ktree/cli/command.h>
#include <ktree/cli/ktree_cli.h>

#include <nlohmann/json.hpp>

#include <iostream>

namespace ktree::cli {

class MoveCommand : public ICommand {
public:
    std::string getName() const override { return "move"; }

    std::string getDescription() const override {
        return "Move an entry to a new path, rewriting links that point at it";
    }

    void registerCommand(CLI::App& app, KtreeCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("move", getDescription());
        cmd->alias("mv");
        cmd->add_option("old-path", oldPath_, "Current entry path")->required();
        cmd->add_option("new-path", newPath_, "Destination path")->required();

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto services = cli_->getServices();
        if (!services) {
            return services.error();
        }
        auto result = services.value().entries->move({oldPath_, newPath_});
        if (!result) {
            return result.error();
        }
        const auto& resp = result.value();

        if (cli_->getJsonOutput()) {
            printJson({{"old_path", resp.oldPath},
                       {"requested_path", resp.requestedPath},
                       {"new_path", resp.newPath},
                       {"conflict_resolved", resp.conflictResolved},
                       {"incoming_references", resp.incomingReferences},
                       {"references_rewritten", resp.referencesRewritten},
                       {"references", toJson(resp.references)},
                       {"warnings", resp.warnings}});
        } else {
            std::cout << "Moved " << resp.oldPath << " -> " << resp.newPath << "\n";
            if (resp.referencesRewritten > 0) {
                std::cout << "  updated links in " << resp.referencesRewritten << " entries\n";
            }
            printWarnings(resp.warnings);
        }
        return Result<void>();
    }

private:
    KtreeCLI* cli_ = nullptr;
    std::string oldPath_;
    std::string newPath_;
};

// Factory function
std::unique_ptr<ICommand> createMoveCommand() {
    return std::make_unique<MoveCommand>();
}

} // namespace ktree::cli
