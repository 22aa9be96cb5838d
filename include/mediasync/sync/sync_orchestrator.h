#pragma once

#include <mediasync/sync/reconciler.h>
#include <mediasync/sync/space_evictor.h>
#include <mediasync/sync/sync.hpp>

#include <vector>

namespace mediasync::sync {

/**
 * Drives one pass over the catalog: scan everything first so the progress counter only counts
 * real work, then evict (when a floor is set) and sync the remaining items in catalog order.
 */
class SyncOrchestrator {
public:
    SyncOrchestrator(Reconciler& reconciler, SpaceEvictor& evictor);

    Result<SyncSummary> syncAll(const Settings& settings,
                                const std::vector<MediaDescriptor>& mediaList);

private:
    Reconciler& reconciler_;
    SpaceEvictor& evictor_;
};

} // namespace mediasync::sync
