#pragma once

#include <mediasync/cli/command.h>
#include <mediasync/sync/sync.hpp>

#include <optional>
#include <string>
#include <vector>

namespace mediasync::cli {

/**
 * The mirror command: `mediasync [options] [catalog.json]`.
 *
 * Flow: settings (config file, then flags) -> disk usage check -> import -> media sync ->
 * subtitle sync.
 */
class SyncCommand : public ICommand {
public:
    std::string getDescription() const override {
        return "Mirror a media catalog into a local directory.";
    }

    void registerCommand(CLI::App& app) override;
    Result<void> execute() override;

    // Config file first, then the flags given on the command line
    Result<sync::Settings> resolveSettings() const;
    void applyOverrides(sync::Settings& settings) const;

    void setConfirmCallback(sync::ConfirmCallback confirm) { confirm_ = std::move(confirm); }

private:
    sync::ConfirmCallback confirm_;

    std::string catalogPath_;
    std::string configPath_;
    std::optional<std::string> mediaDir_;
    std::optional<double> keepFreeMiB_;
    std::optional<double> rateLimitMBps_;
    bool checksums_{false};
    bool fixBroken_{false};
    int quiet_{0};
    std::vector<std::string> subtitles_;
    std::optional<std::string> language_;
    std::optional<std::string> importDir_;
    bool noWarning_{false};
};

} // namespace mediasync::cli
