#include <mediasync/sync/sync_orchestrator.h>

#include <spdlog/spdlog.h>

namespace mediasync::sync {

SyncOrchestrator::SyncOrchestrator(Reconciler& reconciler, SpaceEvictor& evictor)
    : reconciler_(reconciler), evictor_(evictor) {}

Result<SyncSummary> SyncOrchestrator::syncAll(const Settings& settings,
                                              const std::vector<MediaDescriptor>& mediaList) {
    SyncSummary summary;
    summary.total = mediaList.size();

    if (settings.verbose())
        spdlog::info("scanning local files");

    std::vector<const MediaDescriptor*> work;
    work.reserve(mediaList.size());
    for (const auto& media : mediaList) {
        auto valid = reconciler_.isAlreadyValid(settings, media);
        if (!valid)
            return valid.error();
        if (valid.value()) {
            ++summary.alreadyValid;
        } else {
            work.push_back(&media);
        }
    }

    for (std::size_t i = 0; i < work.size(); ++i) {
        const auto& media = *work[i];

        if (settings.keepFreeBytes > 0) {
            auto outcome = evictor_.ensureSpaceFor(settings, SpaceEvictor::referenceFor(media));
            if (!outcome)
                return outcome.error();

            if (outcome.value() == EvictionOutcome::SkipMissingTimestamp) {
                if (settings.normal())
                    spdlog::warn("low disk space and missing metadata, skipping: {}",
                                 media.displayName);
                ++summary.skipped;
                continue;
            }
            if (outcome.value() == EvictionOutcome::HaltLimitReached) {
                summary.halted = true;
                break;
            }
        }

        if (settings.normal())
            spdlog::info("[{}/{}] {}", i + 1, work.size(), media.displayName);

        auto synced = reconciler_.syncOne(settings, media);
        if (!synced)
            return synced.error();
        if (synced.value() == SyncOutcome::Synced) {
            ++summary.synced;
        } else {
            ++summary.failed;
        }
    }

    return summary;
}

} // namespace mediasync::sync
