#include <ktree/cli/cli_output.h>
#include <ktree/cli/command.h>
#include <ktree/cli/ktree_cli.h>

#include <nlohmann/json.hpp>

#include <iostream>

namespace ktree::cli {

using json = nlohmann::json;

class DeleteCommand : public ICommand {
public:
    std::string getName() const override { return "delete"; }

    std::string getDescription() const override {
        return "Delete an entry and remove links pointing at it";
    }

    void registerCommand(CLI::App& app, KtreeCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("delete", getDescription());
        cmd->alias("rm");
        cmd->add_option("path", path_, "Entry path")->required();
        cmd->add_flag("--keep-links", keepLinks_,
                      "Leave relations targeting the entry in other entries");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto services = cli_->getServices();
        if (!services) {
            return services.error();
        }

        app::services::DeleteEntryRequest req;
        req.path = path_;
        if (keepLinks_) {
            req.cleanupLinks = false;
        }
        auto result = services.value().entries->remove(req);
        if (!result) {
            return result.error();
        }
        const auto& resp = result.value();

        if (cli_->getJsonOutput()) {
            printJson({{"path", resp.path},
                       {"cleanup_performed", resp.cleanupPerformed},
                       {"references_removed", resp.referencesRemoved},
                       {"references", toJson(resp.references)},
                       {"warnings", resp.warnings}});
        } else {
            std::cout << "Deleted " << resp.path << "\n";
            if (resp.cleanupPerformed && resp.referencesRemoved > 0) {
                std::cout << "  removed links from " << resp.referencesRemoved << " entries\n";
            }
            printWarnings(resp.warnings);
        }
        return Result<void>();
    }

private:
    KtreeCLI* cli_ = nullptr;
    std::string path_;
    bool keepLinks_ = false;
};

// Factory function
std::unique_ptr<ICommand> createDeleteCommand() {
    return std::make_unique<DeleteCommand>();
}

} // namespace ktree::cli
