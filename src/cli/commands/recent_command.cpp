#include <ktree/cli/cli_output.h>
#include <ktree/cli/command.h>
#include <ktree/cli/ktree_cli.h>

#include <nlohmann/json.hpp>

#include <iostream>

namespace ktree::cli {

using json = nlohmann::json;

class RecentCommand : public ICommand {
public:
    std::string getName() const override { return "recent"; }

    std::string getDescription() const override {
        return "List entries added or modified in the last few days, newest first";
    }

    void registerCommand(CLI::App& app, KtreeCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("recent", getDescription());
        cmd->add_option("--days", days_, "How far back to look")
            ->default_val(7)
            ->check(CLI::PositiveNumber);
        cmd->add_option("--limit", limit_, "Maximum number of entries to show")
            ->default_val(20)
            ->check(CLI::PositiveNumber);
        cmd->add_option("--type", type_, "Which changes to show")
            ->default_val("all")
            ->check(CLI::IsMember({"all", "added", "modified"}));

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto services = cli_->getServices();
        if (!services) {
            return services.error();
        }

        app::services::RecentRequest req;
        req.days = days_;
        req.limit = limit_;
        req.type = app::services::parseChangeType(type_);
        auto result = services.value().stats->recent(req);
        if (!result) {
            return result.error();
        }
        const auto& resp = result.value();

        if (cli_->getJsonOutput()) {
            json entries = json::array();
            for (const auto& change : resp.entries) {
                json item{{"path", change.path},
                          {"change", std::string(app::services::toString(change.change))},
                          {"updated_at", change.updatedAt},
                          {"relationships", change.relationships}};
                if (!change.createdAt.empty()) {
                    item["created_at"] = change.createdAt;
                }
                if (change.priority) {
                    item["priority"] = std::string(model::toString(*change.priority));
                }
                entries.push_back(std::move(item));
            }
            printJson({{"period", {{"days", days_}, {"from", resp.from}, {"to", resp.to}}},
                       {"summary",
                        {{"total_changes", resp.totalChanges},
                         {"showing", resp.entries.size()},
                         {"added", resp.added},
                         {"modified", resp.modified}}},
                       {"entries", entries}});
            return Result<void>();
        }

        if (resp.entries.empty()) {
            std::cout << "No changes in the last " << days_ << " days\n";
            return Result<void>();
        }
        for (const auto& change : resp.entries) {
            const bool added = change.change == app::services::ChangeType::Added;
            std::cout << change.updatedAt << "  " << (added ? "+ " : "~ ") << change.path
                      << "\n";
        }
        std::cout << "Showing " << resp.entries.size() << " of " << resp.totalChanges
                  << " changes (" << resp.added << " added, " << resp.modified
                  << " modified)\n";
        return Result<void>();
    }

private:
    KtreeCLI* cli_ = nullptr;
    int days_ = 7;
    std::size_t limit_ = 20;
    std::string type_ = "all";
};

// Factory function
std::unique_ptr<ICommand> createRecentCommand() {
    return std::make_unique<RecentCommand>();
}

} // namespace ktree::cli
