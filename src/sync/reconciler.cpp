/*
 * mediasync/src/sync/reconciler.cpp
 *
 * Reconciler:
 * - isAlreadyValid(): trust existing files unless fixBroken asks for a size/checksum audit
 * - syncOne(): resume a leftover staging file or start a fresh transfer, then promote
 *
 * Resumed staging files are validated strictly (size, then checksum) and deleted on mismatch.
 * A fresh transfer is accepted once non-empty; its size/checksum audit only logs, so a remote
 * that keeps serving a broken file does not cause an endless re-download cycle.
 */

#include <mediasync/sync/reconciler.h>

#include <spdlog/spdlog.h>

namespace mediasync::sync {

namespace fs = std::filesystem;

Reconciler::Reconciler(IFileSystem& fs, ITransferEngine& transfer) : fs_(fs), transfer_(transfer) {}

Result<bool> Reconciler::checksumMatches(const fs::path& file, const std::string& expected) const {
    auto digest = fs_.checksum(file);
    if (!digest)
        return digest.error();
    return checksumEquals(digest.value(), expected);
}

Result<bool> Reconciler::isAlreadyValid(const Settings& settings,
                                        const MediaDescriptor& media) const {
    const auto file = finalPathFor(settings, media);
    auto st = fs_.stat(file);
    if (!st)
        return false;

    if (!settings.fixBroken)
        return true;

    if (media.expectedSizeBytes && st->sizeBytes != *media.expectedSizeBytes) {
        if (settings.normal())
            spdlog::warn("size mismatch: {}", file.string());
        return false;
    }

    if (settings.verifyChecksums && media.expectedChecksum) {
        auto ok = checksumMatches(file, *media.expectedChecksum);
        if (!ok)
            return ok.error();
        if (!ok.value()) {
            if (settings.normal())
                spdlog::warn("checksum mismatch: {}", file.string());
            return false;
        }
    }

    return true;
}

Result<SyncOutcome> Reconciler::syncOne(const Settings& settings, const MediaDescriptor& media) {
    const auto target = finalPathFor(settings, media);
    const auto staging = stagingPathFor(target);

    if (fs_.exists(staging)) {
        return resumeStaging(settings, media, staging, target);
    }
    return downloadFresh(settings, media, staging, target);
}

Result<SyncOutcome> Reconciler::resumeStaging(const Settings& settings,
                                              const MediaDescriptor& media,
                                              const fs::path& staging, const fs::path& target) {
    auto st = fs_.stat(staging);
    if (!st) {
        return Error{ErrorCode::FileNotFound, "Staging file vanished: " + staging.string()};
    }

    if (media.expectedSizeBytes && st->sizeBytes < *media.expectedSizeBytes) {
        if (settings.normal())
            spdlog::info("resuming: {} ({})", media.filename, media.displayName);

        TransferOptions opts;
        opts.resume = true;
        opts.rateLimitMBps = settings.rateLimitMBps;
        opts.showProgress = settings.verbose();
        auto r = transfer_.transfer(media.url, staging, opts);
        if (!r)
            return r.error();

        st = fs_.stat(staging);
        if (!st) {
            return Error{ErrorCode::FileNotFound,
                         "Staging file missing after transfer: " + staging.string()};
        }
    }

    // Mismatch after a resume fails the item; it is retried from scratch on the next run
    if (media.expectedSizeBytes && st->sizeBytes != *media.expectedSizeBytes) {
        if (settings.normal())
            spdlog::warn("size mismatch, deleting: {}", staging.string());
        auto rm = fs_.remove(staging);
        if (!rm)
            return rm.error();
        return SyncOutcome::Failed;
    }

    if (media.expectedChecksum) {
        auto ok = checksumMatches(staging, *media.expectedChecksum);
        if (!ok)
            return ok.error();
        if (!ok.value()) {
            if (settings.normal())
                spdlog::warn("checksum mismatch, deleting: {}", staging.string());
            auto rm = fs_.remove(staging);
            if (!rm)
                return rm.error();
            return SyncOutcome::Failed;
        }
    }

    auto promoted = promote(media, staging, target);
    if (!promoted)
        return promoted.error();
    return SyncOutcome::Synced;
}

Result<SyncOutcome> Reconciler::downloadFresh(const Settings& settings,
                                              const MediaDescriptor& media,
                                              const fs::path& staging, const fs::path& target) {
    if (settings.normal())
        spdlog::info("downloading: {} ({})", media.filename, media.displayName);

    TransferOptions opts;
    opts.resume = false;
    opts.rateLimitMBps = settings.rateLimitMBps;
    opts.showProgress = settings.verbose();
    auto r = transfer_.transfer(media.url, staging, opts);
    if (!r)
        return r.error();

    auto st = fs_.stat(staging);
    if (!st || st->sizeBytes == 0) {
        if (st) {
            auto rm = fs_.remove(staging);
            if (!rm)
                return rm.error();
        }
        if (settings.normal())
            spdlog::warn("download failed: {}", media.filename);
        return SyncOutcome::Failed;
    }

    auto promoted = promote(media, staging, target);
    if (!promoted)
        return promoted.error();

    // Audit for the log only; the file stays
    auto fst = fs_.stat(target);
    const std::uint64_t finalSize = fst ? fst->sizeBytes : 0;
    if (media.expectedSizeBytes && finalSize != *media.expectedSizeBytes) {
        if (settings.normal())
            spdlog::warn("size mismatch: {}", target.string());
    } else if (settings.verifyChecksums && media.expectedChecksum) {
        auto ok = checksumMatches(target, *media.expectedChecksum);
        if (!ok) {
            spdlog::warn("could not verify {}: {}", target.string(), ok.error().message);
        } else if (!ok.value() && settings.normal()) {
            spdlog::warn("checksum mismatch: {}", target.string());
        }
    }

    return SyncOutcome::Synced;
}

Result<void> Reconciler::promote(const MediaDescriptor& media, const fs::path& staging,
                                 const fs::path& target) {
    if (media.publishDate) {
        auto r = fs_.setMtime(staging, *media.publishDate);
        if (!r)
            return r;
    }
    return fs_.rename(staging, target);
}

} // namespace mediasync::sync
