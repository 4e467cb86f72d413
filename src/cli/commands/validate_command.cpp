#include <ktree/cli/cli_output.h>
#include <ktree/cli/command.h>
#include <ktree/cli/ktree_cli.h>

#include <nlohmann/json.hpp>

#include <iostream>

namespace ktree::cli {

using json = nlohmann::json;

class ValidateCommand : public ICommand {
public:
    std::string getName() const override { return "validate"; }

    std::string getDescription() const override {
        return "Check entries for unreadable documents, broken links and missing mirrors";
    }

    void registerCommand(CLI::App& app, KtreeCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("validate", getDescription());
        cmd->add_option("path", path_, "Check a single entry instead of the whole store");
        cmd->add_flag("--fix", fix_, "Add missing mirror links");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto services = cli_->getServices();
        if (!services) {
            return services.error();
        }

        app::services::ValidateRequest req;
        if (!path_.empty()) {
            req.path = path_;
        }
        req.fix = fix_;
        auto result = services.value().validation->validate(req);
        if (!result) {
            return result.error();
        }
        const auto& resp = result.value();

        if (cli_->getJsonOutput()) {
            json issues = json::array();
            for (const auto& issue : resp.issues) {
                json item{{"kind", std::string(app::services::toString(issue.kind))},
                          {"path", issue.path},
                          {"message", issue.message},
                          {"fixed", issue.fixed}};
                if (!issue.targetPath.empty()) {
                    item["target"] = issue.targetPath;
                }
                if (issue.relationship) {
                    item["relationship"] = std::string(model::toString(*issue.relationship));
                }
                issues.push_back(std::move(item));
            }
            printJson({{"checked", resp.checked}, {"issues", issues}, {"fixed", resp.fixed}});
            return Result<void>();
        }

        for (const auto& issue : resp.issues) {
            std::cout << (issue.fixed ? "[FIXED] " : "[ISSUE] ")
                      << app::services::toString(issue.kind) << ": " << issue.message << "\n";
        }
        std::cout << "Checked " << resp.checked << " entries, " << resp.issues.size()
                  << " issues";
        if (fix_) {
            std::cout << ", " << resp.fixed << " fixed";
        }
        std::cout << "\n";
        return Result<void>();
    }

private:
    KtreeCLI* cli_ = nullptr;
    std::string path_;
    bool fix_ = false;
};

// Factory function
std::unique_ptr<ICommand> createValidateCommand() {
    return std::make_unique<ValidateCommand>();
}

} // namespace ktree::cli
