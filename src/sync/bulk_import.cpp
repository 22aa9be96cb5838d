#include <mediasync/sync/bulk_import.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace mediasync::sync {

BulkImporter::BulkImporter(IFileSystem& fs, SpaceEvictor& evictor) : fs_(fs), evictor_(evictor) {}

Result<std::vector<FileStat>> BulkImporter::candidates(const Settings& settings) const {
    if (!settings.importDir) {
        return Error{ErrorCode::InvalidArgument, "no import directory configured"};
    }

    auto listed = fs_.listFiles(*settings.importDir, settings.mediaExtensions);
    if (!listed)
        return listed.error();

    std::vector<FileStat> out;
    for (const auto& source : listed.value()) {
        // Size comparison only; contents are not checksummed
        auto existing = fs_.stat(settings.mediaDir / source.path.filename());
        if (!existing || existing->sizeBytes != source.sizeBytes) {
            out.push_back(source);
        }
    }

    std::stable_sort(out.begin(), out.end(),
                     [](const FileStat& a, const FileStat& b) { return a.mtime > b.mtime; });
    return out;
}

Result<ImportSummary> BulkImporter::importAll(const Settings& settings) {
    ImportSummary summary;

    auto found = candidates(settings);
    if (!found)
        return found.error();
    const auto& sources = found.value();
    summary.candidates = sources.size();

    for (std::size_t i = 0; i < sources.size(); ++i) {
        const auto& source = sources[i];
        const auto name = source.path.filename();

        if (settings.keepFreeBytes > 0) {
            EvictionReference ref;
            ref.name = name.string();
            ref.sizeBytes = source.sizeBytes;
            ref.date = source.mtime;

            auto outcome = evictor_.ensureSpaceFor(settings, ref);
            if (!outcome)
                return outcome.error();
            if (outcome.value() == EvictionOutcome::HaltLimitReached) {
                summary.halted = true;
                break;
            }
            if (outcome.value() == EvictionOutcome::SkipMissingTimestamp) {
                ++summary.skipped;
                continue;
            }
        }

        if (settings.verbose())
            spdlog::info("copying [{}/{}]: {}", i + 1, sources.size(), name.string());

        auto copied = fs_.copyWithMetadata(source.path, settings.mediaDir / name);
        if (!copied) {
            spdlog::warn("skipping {}: {}", source.path.string(), copied.error().message);
            ++summary.skipped;
            continue;
        }
        ++summary.copied;
    }

    return summary;
}

} // namespace mediasync::sync
