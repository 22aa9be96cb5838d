#pragma once

#include <CLI/CLI.hpp>
#include <mediasync/cli/command.h>

#include <memory>

namespace mediasync::cli {

/**
 * Main CLI application class
 */
class MediaSyncCLI {
public:
    MediaSyncCLI();
    ~MediaSyncCLI();

    /**
     * Run the CLI with given arguments; returns the process exit status
     */
    int run(int argc, char* argv[]);

private:
    std::unique_ptr<CLI::App> app_;
    std::unique_ptr<ICommand> command_;
    bool debug_{false};
};

} // namespace mediasync::cli
