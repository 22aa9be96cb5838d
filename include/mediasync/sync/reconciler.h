#pragma once

#include <mediasync/sync/sync.hpp>

namespace mediasync::sync {

/**
 * Decides whether a local media file is acceptable and brings it in line with the catalog.
 *
 * Existing final files are trusted unless Settings::fixBroken asks for an audit. Staging files
 * left by an interrupted run are resumed and then strictly validated; a mismatch deletes the
 * staging file and fails the item. Fresh downloads are accepted once non-empty and only audited
 * for the log.
 */
class Reconciler {
public:
    Reconciler(IFileSystem& fs, ITransferEngine& transfer);

    /**
     * True when the final file exists and passes the checks requested by settings.
     */
    Result<bool> isAlreadyValid(const Settings& settings, const MediaDescriptor& media) const;

    /**
     * Resume or download one item and promote it to its final name.
     * Transfer and filesystem errors are returned, not handled.
     */
    Result<SyncOutcome> syncOne(const Settings& settings, const MediaDescriptor& media);

private:
    Result<SyncOutcome> resumeStaging(const Settings& settings, const MediaDescriptor& media,
                                      const std::filesystem::path& staging,
                                      const std::filesystem::path& target);
    Result<SyncOutcome> downloadFresh(const Settings& settings, const MediaDescriptor& media,
                                      const std::filesystem::path& staging,
                                      const std::filesystem::path& target);
    Result<void> promote(const MediaDescriptor& media, const std::filesystem::path& staging,
                         const std::filesystem::path& target);
    Result<bool> checksumMatches(const std::filesystem::path& file,
                                 const std::string& expected) const;

    IFileSystem& fs_;
    ITransferEngine& transfer_;
};

} // namespace mediasync::sync
