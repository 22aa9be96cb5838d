#include <mediasync/sync/space_evictor.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace mediasync::sync {

SpaceEvictor::SpaceEvictor(IFileSystem& fs) : fs_(fs) {}

EvictionReference SpaceEvictor::referenceFor(const MediaDescriptor& media) {
    EvictionReference ref;
    ref.name = media.displayName.empty() ? media.filename : media.displayName;
    ref.sizeBytes = media.expectedSizeBytes.value_or(0);
    ref.date = media.publishDate;
    return ref;
}

Result<EvictionOutcome> SpaceEvictor::ensureSpaceFor(const Settings& settings,
                                                     const EvictionReference& reference) {
    const std::uint64_t needed = reference.sizeBytes + settings.keepFreeBytes;

    for (;;) {
        auto space = fs_.freeSpace(settings.mediaDir);
        if (!space)
            return space.error();
        if (space.value() >= needed)
            return EvictionOutcome::Proceed;

        if (settings.verbose()) {
            spdlog::info("free space: {} MiB, needed: {} MiB", space.value() / MiB, needed / MiB);
        }

        // Without a date there is no telling whether stored files are older or newer
        if (!reference.date)
            return EvictionOutcome::SkipMissingTimestamp;

        auto files = fs_.listFiles(settings.mediaDir, settings.mediaExtensions);
        if (!files)
            return files.error();
        if (files.value().empty()) {
            return Error{ErrorCode::StorageFull,
                         "cannot free more disk space, no media files in " +
                             settings.mediaDir.string()};
        }

        const auto& all = files.value();
        const auto oldest = std::min_element(
            all.begin(), all.end(),
            [](const FileStat& a, const FileStat& b) { return a.mtime < b.mtime; });

        if (*reference.date <= oldest->mtime) {
            if (settings.verbose())
                spdlog::info("disk limit reached, all media up to date");
            return EvictionOutcome::HaltLimitReached;
        }

        if (settings.normal())
            spdlog::info("removing old media: {}", oldest->path.string());
        auto rm = fs_.remove(oldest->path);
        if (!rm)
            return rm.error();
    }
}

} // namespace mediasync::sync
