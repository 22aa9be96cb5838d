#include <mediasync/cli/mediasync_cli.h>
#include <mediasync/cli/sync_command.h>

#include <spdlog/spdlog.h>

#include <iostream>

namespace mediasync::cli {

MediaSyncCLI::MediaSyncCLI() : command_(std::make_unique<SyncCommand>()) {
    app_ = std::make_unique<CLI::App>("mediasync - " + command_->getDescription(), "mediasync");
    app_->set_version_flag("--version", "mediasync 0.1.0");
    app_->add_flag("--debug", debug_, "Enable debug logging");
    command_->registerCommand(*app_);
}

MediaSyncCLI::~MediaSyncCLI() = default;

int MediaSyncCLI::run(int argc, char* argv[]) {
    try {
        app_->parse(argc, argv);

        spdlog::set_level(debug_ ? spdlog::level::debug : spdlog::level::info);

        auto result = command_->execute();
        if (!result) {
            spdlog::error("{}: {}", result.error().code, result.error().message);
            return 1;
        }
        return 0;
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "[FAIL] Unexpected error: " << e.what() << "\n";
        spdlog::error("Unexpected error: {}", e.what());
        return 1;
    }
}

} // namespace mediasync::cli
