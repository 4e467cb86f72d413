#include <ktree/cli/cli_output.h>
#include <ktree/cli/command.h>
#include <ktree/cli/ktree_cli.h>

#include <nlohmann/json.hpp>

#include <iomanip>
#include <iostream>

namespace ktree::cli {

using json = nlohmann::json;

namespace {

double percentOf(std::size_t part, std::size_t total) {
    if (total == 0) {
        return 0.0;
    }
    return static_cast<double>(part) * 100.0 / static_cast<double>(total);
}

} // namespace

class StatsCommand : public ICommand {
public:
    std::string getName() const override { return "stats"; }

    std::string getDescription() const override {
        return "Show entry counts, priority and category breakdowns, orphans and link hubs";
    }

    void registerCommand(CLI::App& app, KtreeCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("stats", getDescription());
        cmd->add_option("--top", top_, "Number of most-linked entries to show")
            ->default_val(10)
            ->check(CLI::NonNegativeNumber);
        cmd->add_option("--orphans", orphans_, "Number of orphaned entries to list")
            ->default_val(10)
            ->check(CLI::NonNegativeNumber);

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto services = cli_->getServices();
        if (!services) {
            return services.error();
        }

        app::services::StatsRequest req;
        req.topLinked = top_;
        auto result = services.value().stats->getStats(req);
        if (!result) {
            return result.error();
        }
        const auto& resp = result.value();

        if (cli_->getJsonOutput()) {
            printJson(toJson(resp));
            return Result<void>();
        }

        std::cout << std::fixed << std::setprecision(1);
        std::cout << "Entries:            " << resp.totalEntries << "\n"
                  << "Unreadable:         " << resp.unreadable << "\n"
                  << "With code:          " << resp.withCode << "\n"
                  << "With relationships: " << resp.withRelationships << "\n"
                  << "Relationships:      " << resp.totalRelationships << " ("
                  << resp.averageLinks << " per entry)\n";

        std::cout << "\nPriorities:\n";
        for (const auto& [priority, count] : resp.priorities) {
            std::cout << "  " << std::left << std::setw(10) << model::toString(priority)
                      << std::right << " " << count << " ("
                      << percentOf(count, resp.totalEntries) << "%)\n";
        }

        std::cout << "\nCategories:\n";
        for (const auto& [name, category] : resp.categories) {
            std::cout << "  " << name << ": " << category.count;
            if (!category.subcategories.empty()) {
                std::cout << " (" << category.subcategories.size() << " subcategories)";
            }
            std::cout << "\n";
        }

        std::cout << "\nOrphaned: " << resp.orphaned.size() << " ("
                  << percentOf(resp.orphaned.size(), resp.totalEntries) << "%)\n";
        for (std::size_t i = 0; i < resp.orphaned.size() && i < orphans_; ++i) {
            std::cout << "  " << resp.orphaned[i] << "\n";
        }

        if (!resp.mostLinked.empty()) {
            std::cout << "\nMost linked:\n";
            for (const auto& item : resp.mostLinked) {
                std::cout << "  " << item.path << ": " << item.incomingLinks
                          << (item.exists ? "" : " (missing)") << "\n";
            }
        }
        return Result<void>();
    }

private:
    json toJson(const app::services::StatsResponse& resp) const {
        json priorities = json::object();
        for (const auto& [priority, count] : resp.priorities) {
            priorities[std::string(model::toString(priority))] = {
                {"count", count}, {"percentage", percentOf(count, resp.totalEntries)}};
        }

        json categories = json::object();
        for (const auto& [name, category] : resp.categories) {
            categories[name] = {{"count", category.count},
                                {"priorities", category.priorities},
                                {"subcategories", category.subcategories}};
        }

        json orphaned = json::array();
        for (std::size_t i = 0; i < resp.orphaned.size() && i < orphans_; ++i) {
            orphaned.push_back(resp.orphaned[i]);
        }

        json popular = json::array();
        for (const auto& item : resp.mostLinked) {
            popular.push_back({{"path", item.path},
                               {"incoming_links", item.incomingLinks},
                               {"exists", item.exists}});
        }

        return json{{"summary",
                     {{"total_entries", resp.totalEntries},
                      {"unreadable", resp.unreadable},
                      {"with_code_examples", resp.withCode},
                      {"with_relationships", resp.withRelationships},
                      {"total_relationships", resp.totalRelationships}}},
                    {"priorities", priorities},
                    {"categories", categories},
                    {"orphaned",
                     {{"count", resp.orphaned.size()},
                      {"percentage", percentOf(resp.orphaned.size(), resp.totalEntries)},
                      {"entries", orphaned}}},
                    {"popular", {{"most_linked", popular}, {"average_links", resp.averageLinks}}}};
    }

    KtreeCLI* cli_ = nullptr;
    std::size_t top_ = 10;
    std::size_t orphans_ = 10;
};

// Factory function
std::unique_ptr<ICommand> createStatsCommand() {
    return std::make_unique<StatsCommand>();
}

} // namespace ktree::cli
