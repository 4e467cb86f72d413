#include <ktree/cli/cli_output.h>
#include <ktree/cli/command.h>
#include <ktree/cli/ktree_cli.h>

#include <nlohmann/json.hpp>

#include <iostream>

namespace ktree::cli {

class ListCommand : public ICommand {
public:
    std::string getName() const override { return "list"; }

    std::string getDescription() const override { return "List entry paths"; }

    void registerCommand(CLI::App& app, KtreeCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("list", getDescription());
        cmd->alias("ls");
        cmd->add_option("prefix", prefix_, "Only entries under this directory");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto services = cli_->getServices();
        if (!services) {
            return services.error();
        }
        auto result = services.value().entries->list({prefix_});
        if (!result) {
            return result.error();
        }
        const auto& paths = result.value().paths;

        if (cli_->getJsonOutput()) {
            printJson({{"count", paths.size()}, {"paths", paths}});
        } else {
            for (const auto& p : paths) {
                std::cout << p << "\n";
            }
        }
        return Result<void>();
    }

private:
    KtreeCLI* cli_ = nullptr;
    std::string prefix_;
};

// Factory function
std::unique_ptr<ICommand> createListCommand() {
    return std::make_unique<ListCommand>();
}

} // namespace ktree::cli
