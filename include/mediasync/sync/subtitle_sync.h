#pragma once

#include <mediasync/sync/sync.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace mediasync::sync {

/**
 * Downloads caption files next to their media file as "<stem>.<iso639><ext>".
 * Independent of eviction and resume: a caption is fetched whole or not at all.
 */
class SubtitleSync {
public:
    struct Job {
        std::string url;
        std::filesystem::path destination;
        std::string mediaName;
    };

    SubtitleSync(IFileSystem& fs, ITransferEngine& transfer, LanguageLookup languages);

    /**
     * Caption files the settings select that are missing (or all of them with fixBroken).
     */
    std::vector<Job> plan(const Settings& settings,
                          const std::vector<MediaDescriptor>& mediaList) const;

    Result<SubtitleSummary> syncAll(const Settings& settings,
                                    const std::vector<MediaDescriptor>& mediaList);

private:
    IFileSystem& fs_;
    ITransferEngine& transfer_;
    LanguageLookup languages_;
};

} // namespace mediasync::sync
