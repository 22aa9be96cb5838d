#pragma once

#include <mediasync/sync/space_evictor.h>
#include <mediasync/sync/sync.hpp>

#include <vector>

namespace mediasync::sync {

/**
 * Copies already downloaded media from Settings::importDir into the managed directory,
 * newest first, under the same eviction policy as regular downloads.
 */
class BulkImporter {
public:
    BulkImporter(IFileSystem& fs, SpaceEvictor& evictor);

    /**
     * Media files in the import directory whose managed counterpart is missing or differs in
     * size, sorted newest first.
     */
    Result<std::vector<FileStat>> candidates(const Settings& settings) const;

    Result<ImportSummary> importAll(const Settings& settings);

private:
    IFileSystem& fs_;
    SpaceEvictor& evictor_;
};

} // namespace mediasync::sync
