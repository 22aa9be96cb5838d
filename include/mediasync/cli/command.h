#pragma once

#include <CLI/CLI.hpp>
#include <mediasync/core/types.h>

#include <string>

namespace mediasync::cli {

/**
 * Base interface for CLI commands
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * Get the command description for help text
     */
    virtual std::string getDescription() const = 0;

    /**
     * Register this command's options with the CLI11 app
     */
    virtual void registerCommand(CLI::App& app) = 0;

    /**
     * Execute the command
     */
    virtual Result<void> execute() = 0;
};

} // namespace mediasync::cli
