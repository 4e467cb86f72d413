#include <ktree/cli/cli_output.h>
#include <ktree/cli/command.h>
#include <ktree/cli/ktree_cli.h>
#include <ktree/graph/traversal_engine.h>

#include <spdlog/spdlog.h>

#include <optional>

namespace ktree::cli {

class GetCommand : public ICommand {
public:
    std::string getName() const override { return "get"; }

    std::string getDescription() const override {
        return "Read an entry together with the entries it links to";
    }

    void registerCommand(CLI::App& app, KtreeCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("get", getDescription());
        cmd->add_option("path", path_, "Entry path")->required();
        cmd->add_option("-d,--depth", depth_,
                        "Relation hops to expand (1 = entry only; default from config)")
            ->check(CLI::PositiveNumber);

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto services = cli_->getServices();
        if (!services) {
            return services.error();
        }

        app::services::ReadEntryRequest req;
        req.path = path_;
        req.depth = depth_;
        auto result = services.value().entries->read(req);
        if (!result) {
            return result.error();
        }

        const auto& resp = result.value();
        spdlog::debug("Read {} at depth {}: {} entries", resp.root.path, resp.depth,
                      graph::countResolved(resp.root));
        // Entries are JSON documents; both output modes print the expanded tree
        printJson(graph::toJson(resp.root));
        return Result<void>();
    }

private:
    KtreeCLI* cli_ = nullptr;
    std::string path_;
    std::optional<int> depth_;
};

// Factory function
std::unique_ptr<ICommand> createGetCommand() {
    return std::make_unique<GetCommand>();
}

} // namespace ktree::cli
