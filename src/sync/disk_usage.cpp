#include <mediasync/sync/disk_usage.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace mediasync::sync {

DiskUsageReporter::DiskUsageReporter(IFileSystem& fs, ConfirmCallback confirm)
    : fs_(fs), confirm_(std::move(confirm)) {}

Result<bool> DiskUsageReporter::check(const Settings& settings) {
    auto space = fs_.freeSpace(settings.mediaDir);
    if (!space)
        return space.error();
    const std::uint64_t available = space.value();

    if (settings.verbose()) {
        spdlog::info("note: old media files in {} will be deleted if space runs low",
                     settings.mediaDir.string());
        spdlog::info("free space: {} MiB, minimum limit: {} MiB", available / MiB,
                     settings.keepFreeBytes / MiB);
    }

    if (!settings.diskWarning || available >= settings.keepFreeBytes)
        return true;

    spdlog::warn("The disk usage currently exceeds the limit by {} MiB.",
                 (settings.keepFreeBytes - available) / MiB);
    spdlog::warn("If the limit was set too high by mistake, many or ALL currently downloaded "
                 "media files may get deleted.");

    if (!confirm_)
        return false;
    return confirm_("Do you want to proceed anyway? [y/N]: ");
}

} // namespace mediasync::sync
