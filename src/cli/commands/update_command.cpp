#include <ktree/cli/cli_output.h>
#include <ktree/cli/command.h>
#include <ktree/cli/ktree_cli.h>
#include <ktree/model/entry_codec.h>

#include <nlohmann/json.hpp>

#include <iostream>

namespace ktree::cli {

using json = nlohmann::json;

class UpdateCommand : public ICommand {
public:
    std::string getName() const override { return "update"; }

    std::string getDescription() const override {
        return "Patch fields of an entry, optionally relocating it";
    }

    void registerCommand(CLI::App& app, KtreeCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("update", getDescription());
        cmd->add_option("path", path_, "Entry path")->required();
        cmd->add_option("-f,--file", file_,
                        "Patch document (JSON object with the fields to change); '-' reads stdin")
            ->default_val("-");
        cmd->add_option("--new-path", newPath_,
                        "Move the entry to this path as part of the update");

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
        auto patch = model::decodeEntryPatch(doc.value());
        if (!patch) {
            return patch.error();
        }

        app::services::UpdateEntryRequest req;
        req.path = path_;
        req.patch = std::move(patch).value();
        if (!newPath_.empty()) {
            req.newPath = newPath_;
        }

        auto result = services.value().entries->update(req);
        if (!result) {
            return result.error();
        }
        const auto& resp = result.value();

        if (cli_->getJsonOutput()) {
            json out{{"path", resp.path},
                     {"moved", resp.moved},
                     {"updated_fields", resp.updatedFields},
                     {"mirrors_removed", toJson(resp.mirrorsRemoved)},
                     {"mirrors_added", toJson(resp.mirrorsAdded)},
                     {"warnings", resp.warnings}};
            if (resp.previousPath) {
                out["previous_path"] = *resp.previousPath;
                out["references"] = toJson(resp.references);
            }
            printJson(out);
        } else {
            std::cout << "Updated " << resp.path;
            if (!resp.updatedFields.empty()) {
                std::cout << " (";
                for (size_t i = 0; i < resp.updatedFields.size(); ++i) {
                    std::cout << (i ? ", " : "") << resp.updatedFields[i];
                }
                std::cout << ")";
            }
            std::cout << "\n";
            if (resp.previousPath) {
                std::cout << "  moved from " << *resp.previousPath << "\n";
            }
            printWarnings(resp.warnings);
        }
        return Result<void>();
    }

private:
    KtreeCLI* cli_ = nullptr;
    std::string path_;
    std::string file_;
    std::string newPath_;
};

// Factory function
std::unique_ptr<ICommand> createUpdateCommand() {
    return std::make_unique<UpdateCommand>();
}

} // namespace ktree::cli
