#include <ktree/cli/ktree_cli.h>

#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    try {
        // Conservative default; KtreeCLI::run() adjusts based on flags and config
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        ktree::cli::KtreeCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
