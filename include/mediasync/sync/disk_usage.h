#pragma once

#include <mediasync/sync/sync.hpp>

namespace mediasync::sync {

/**
 * Startup report of free space against the configured floor.
 *
 * When the volume is already below the floor, eviction could remove most of the library, so
 * the caller's confirmation callback decides whether to go on.
 */
class DiskUsageReporter {
public:
    DiskUsageReporter(IFileSystem& fs, ConfirmCallback confirm);

    /**
     * True to proceed. A missing callback counts as "no".
     */
    Result<bool> check(const Settings& settings);

private:
    IFileSystem& fs_;
    ConfirmCallback confirm_;
};

} // namespace mediasync::sync
