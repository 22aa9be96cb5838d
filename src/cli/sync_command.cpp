#include <mediasync/catalog/catalog.h>
#include <mediasync/cli/prompt_util.h>
#include <mediasync/cli/sync_command.h>
#include <mediasync/config/config_helpers.h>
#include <mediasync/config/settings_loader.h>
#include <mediasync/sync/bulk_import.h>
#include <mediasync/sync/disk_usage.h>
#include <mediasync/sync/reconciler.h>
#include <mediasync/sync/space_evictor.h>
#include <mediasync/sync/subtitle_sync.h>
#include <mediasync/sync/sync_orchestrator.h>
#include <mediasync/sync/transfer_engine.h>

#include <spdlog/spdlog.h>

namespace mediasync::cli {

void SyncCommand::registerCommand(CLI::App& app) {
    app.add_option("catalog", catalogPath_, "Catalog JSON describing the media to mirror.");
    app.add_option("-c,--config", configPath_,
                   "Config file (default $MEDIASYNC_CONFIG or "
                   "$XDG_CONFIG_HOME/mediasync/config.toml).");
    app.add_option("-d,--dir", mediaDir_, "Media directory to mirror into.");
    app.add_option("--keep-free", keepFreeMiB_,
                   "Keep at least this many MiB free; deletes the oldest media when needed.")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--rate-limit", rateLimitMBps_, "Download rate limit in MB/s (0 = unlimited).")
        ->check(CLI::NonNegativeNumber);
    app.add_flag("--checksums", checksums_, "Verify MD5 checksums of existing files.");
    app.add_flag("--fix-broken", fixBroken_,
                 "Re-check existing files and download again what is broken.");
    app.add_flag_function(
        "-q,--quiet", [this](std::int64_t count) { quiet_ = static_cast<int>(count); },
        "Less output (repeat for silence).");
    app.add_option("--subtitles", subtitles_, "Download subtitles for these language tags.")
        ->delimiter(',');
    app.add_option("--lang", language_, "Primary language tag (default E).");
    app.add_option("--import", importDir_,
                   "Copy pre-downloaded media from this directory before syncing.");
    app.add_flag("--no-warning", noWarning_, "Do not ask before continuing with low disk space.");
}

void SyncCommand::applyOverrides(sync::Settings& settings) const {
    if (mediaDir_)
        settings.mediaDir = config::expand_tilde(*mediaDir_);
    if (keepFreeMiB_)
        settings.keepFreeBytes = static_cast<std::uint64_t>(*keepFreeMiB_ * MiB);
    if (rateLimitMBps_)
        settings.rateLimitMBps = *rateLimitMBps_;
    if (checksums_)
        settings.verifyChecksums = true;
    if (fixBroken_)
        settings.fixBroken = true;
    if (quiet_ > 0)
        settings.quiet = quiet_;
    for (const auto& lang : subtitles_)
        settings.subtitleLanguages.insert(lang);
    if (language_)
        settings.primaryLanguage = *language_;
    if (importDir_)
        settings.importDir = config::expand_tilde(*importDir_);
    if (noWarning_)
        settings.diskWarning = false;
}

Result<sync::Settings> SyncCommand::resolveSettings() const {
    const auto path = config::get_config_path(configPath_);
    auto loaded = config::loadSettings(path);
    if (!loaded)
        return loaded.error();
    auto settings = std::move(loaded).value();
    applyOverrides(settings);
    return settings;
}

Result<void> SyncCommand::execute() {
    auto resolved = resolveSettings();
    if (!resolved)
        return resolved.error();
    const auto settings = std::move(resolved).value();

    if (catalogPath_.empty() && !settings.importDir) {
        return Error{ErrorCode::InvalidArgument, "Nothing to do: give a catalog or --import"};
    }

    auto fs = sync::makeLocalFileSystem();
    auto http = sync::makeCurlHttpAdapter();
    sync::TransferEngine transfer(*http);
    sync::SpaceEvictor evictor(*fs);

    if (settings.keepFreeBytes > 0) {
        sync::ConfirmCallback confirm = confirm_;
        if (!confirm)
            confirm = [](const std::string& prompt) { return prompt_yes_no(prompt); };
        sync::DiskUsageReporter usage(*fs, confirm);
        auto proceed = usage.check(settings);
        if (!proceed)
            return proceed.error();
        if (!proceed.value()) {
            return Error{ErrorCode::StorageFull, "Not enough free space, aborted"};
        }
    }

    if (settings.importDir) {
        sync::BulkImporter importer(*fs, evictor);
        auto imported = importer.importAll(settings);
        if (!imported)
            return imported.error();
        const auto& s = imported.value();
        if (settings.normal()) {
            spdlog::info("import: {} candidate(s), {} copied, {} skipped{}", s.candidates,
                         s.copied, s.skipped, s.halted ? ", stopped at disk limit" : "");
        }
    }

    if (catalogPath_.empty())
        return Result<void>{};

    auto loaded = catalog::loadCatalog(catalogPath_);
    if (!loaded)
        return loaded.error();
    const auto catalog = std::move(loaded).value();

    sync::Reconciler reconciler(*fs, transfer);
    sync::SyncOrchestrator orchestrator(reconciler, evictor);
    auto synced = orchestrator.syncAll(settings, catalog.media);
    if (!synced)
        return synced.error();
    const auto& summary = synced.value();
    if (settings.normal()) {
        spdlog::info("sync: {} item(s), {} up to date, {} downloaded, {} failed, {} skipped",
                     summary.total, summary.alreadyValid, summary.synced, summary.failed,
                     summary.skipped);
    }

    if (settings.subtitlesRequested()) {
        sync::SubtitleSync subtitles(*fs, transfer, catalog.languageLookup());
        auto subs = subtitles.syncAll(settings, catalog.media);
        if (!subs)
            return subs.error();
        if (settings.normal()) {
            spdlog::info("subtitles: {} queued, {} downloaded", subs.value().queued,
                         subs.value().downloaded);
        }
    }

    return Result<void>{};
}

} // namespace mediasync::cli
