#pragma once

#include <mediasync/sync/sync.hpp>

namespace mediasync::sync {

/**
 * Frees space in the managed directory by deleting the oldest media file (by mtime, which is
 * the publish date stamped at promotion) until the reference item plus the configured floor
 * fits.
 *
 * Never deletes anything when the reference has no date, and never deletes a file that is as
 * new as or newer than the reference. Running out of candidates while space is still short is
 * reported as ErrorCode::StorageFull.
 */
class SpaceEvictor {
public:
    explicit SpaceEvictor(IFileSystem& fs);

    Result<EvictionOutcome> ensureSpaceFor(const Settings& settings,
                                           const EvictionReference& reference);

    static EvictionReference referenceFor(const MediaDescriptor& media);

private:
    IFileSystem& fs_;
};

} // namespace mediasync::sync
