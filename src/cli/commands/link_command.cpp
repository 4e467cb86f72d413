#include <ktree/cli/cli_output.h>
#include <ktree/cli/command.h>
#include <ktree/cli/ktree_cli.h>
#include <ktree/model/relationships.h>

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

#include <iostream>
#include <vector>

namespace ktree::cli {

class LinkCommand : public ICommand {
public:
    std::string getName() const override { return "link"; }

    std::string getDescription() const override {
        return "Relate two entries; symmetric kinds are mirrored on the target";
    }

    void registerCommand(CLI::App& app, KtreeCLI* cli) override {
        cli_ = cli;

        std::vector<std::string> kinds;
        for (auto kind : model::kAllRelationshipKinds) {
            kinds.emplace_back(model::toString(kind));
        }

        auto* cmd = app.add_subcommand("link", getDescription());
        cmd->add_option("from", from_, "Source entry path")->required();
        cmd->add_option("to", to_, "Target entry path")->required();
        cmd->add_option("-k,--kind", kind_, "Relationship kind")
            ->default_val("related")
            ->check(CLI::IsMember(kinds));
        cmd->add_option("-d,--description", description_, "Why the entries are related");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto kind = model::parseRelationshipKind(kind_);
        if (!kind) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("Unknown relationship kind '{}'", kind_)};
        }
        auto services = cli_->getServices();
        if (!services) {
            return services.error();
        }

        app::services::LinkEntriesRequest req;
        req.fromPath = from_;
        req.toPath = to_;
        req.kind = *kind;
        if (!description_.empty()) {
            req.description = description_;
        }
        auto result = services.value().entries->link(req);
        if (!result) {
            return result.error();
        }
        const auto& resp = result.value();

        if (cli_->getJsonOutput()) {
            printJson({{"from", resp.fromPath},
                       {"to", resp.toPath},
                       {"relationship", std::string(model::toString(resp.kind))},
                       {"created", resp.created},
                       {"mirrored", model::isSymmetric(resp.kind)},
                       {"mirrors", toJson(resp.mirrors)},
                       {"warnings", resp.warnings}});
        } else {
            std::cout << (resp.created ? "Linked " : "Updated link ") << resp.fromPath << " -["
                      << model::toString(resp.kind) << "]-> " << resp.toPath << "\n";
            if (resp.mirrors.modified > 0) {
                std::cout << "  mirrored on " << resp.toPath << "\n";
            }
            printWarnings(resp.warnings);
        }
        return Result<void>();
    }

private:
    KtreeCLI* cli_ = nullptr;
    std::string from_;
    std::string to_;
    std::string kind_;
    std::string description_;
};

// Factory function
std::unique_ptr<ICommand> createLinkCommand() {
    return std::make_unique<LinkCommand>();
}

} // namespace ktree::cli
