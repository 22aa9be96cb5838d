#include <spdlog/spdlog.h>
#include <mediasync/cli/mediasync_cli.h>

int main(int argc, char* argv[]) {
    try {
        // MediaSyncCLI::run() adjusts the level based on flags
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        mediasync::cli::MediaSyncCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
