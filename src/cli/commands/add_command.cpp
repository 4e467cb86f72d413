#include <ktree/cli/cli_output.h>
#include <ktree/cli/command.h>
#include <ktree/cli/ktree_cli.h>
#include <ktree/model/entry_codec.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <iostream>

namespace ktree::cli {

using json = nlohmann::json;

class AddCommand : public ICommand {
public:
    std::string getName() const override { return "add"; }

    std::string getDescription() const override {
        return "Create a knowledge entry from a JSON document";
    }

    void registerCommand(CLI::App& app, KtreeCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("add", getDescription());
        cmd->add_option("path", path_, "Entry path (e.g. backend/redis/caching)")->required();
        cmd->add_option("-f,--file", file_, "Entry document (JSON); '-' reads stdin")
            ->default_val("-");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto services = cli_->getServices();
        if (!services) {
            return services.error();
        }
        auto doc = readJsonInput(file_);
        if (!doc) {
            return doc.error();
        }
        auto entry = model::decodeEntryDraft(doc.value());
        if (!entry) {
            return entry.error();
        }

        auto result = services.value().entries->create({path_, std::move(entry).value()});
        if (!result) {
            return result.error();
        }
        const auto& resp = result.value();

        if (cli_->getJsonOutput()) {
            printJson({{"path", resp.path},
                       {"entry", model::toJson(resp.entry)},
                       {"mirrors", toJson(resp.mirrors)},
                       {"warnings", resp.warnings}});
        } else {
            std::cout << "Created " << resp.path << "\n";
            if (resp.mirrors.modified > 0) {
                std::cout << "  mirrored on " << resp.mirrors.modified << " related entries\n";
            }
            printWarnings(resp.warnings);
        }
        return Result<void>();
    }

private:
    KtreeCLI* cli_ = nullptr;
    std::string path_;
    std::string file_;
};

// Factory function
std::unique_ptr<ICommand> createAddCommand() {
    return std::make_unique<AddCommand>();
}

} // namespace ktree::cli
