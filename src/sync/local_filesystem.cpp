/*
 * mediasync/src/sync/local_filesystem.cpp
 *
 * LocalFileSystem implementation of IFileSystem:
 * - stat()/setMtime() work on POSIX timestamps with nanosecond precision
 * - rename() fsyncs the source first so a promoted file is never empty after a crash
 * - EXDEV fallback: copy + fsync + remove when the rename crosses devices
 * - copyWithMetadata() preserves mtime and permissions (import of pre-downloaded media)
 */

#include <mediasync/sync/sync.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace mediasync::sync {

namespace fs = std::filesystem;

namespace {

TimePoint from_timespec(const struct timespec& ts) {
    auto d = std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec);
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(d));
}

struct timespec to_timespec(TimePoint tp) {
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch());
    auto secs = std::chrono::floor<std::chrono::seconds>(ns);
    struct timespec ts{};
    ts.tv_sec = static_cast<time_t>(secs.count());
    ts.tv_nsec = static_cast<long>((ns - secs).count());
    return ts;
}

std::string lower_extension(const fs::path& p) {
    auto ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

Result<void> fsync_file(const fs::path& p) {
    int fd = ::open(p.c_str(), O_RDONLY);
    if (fd < 0) {
        return Error{ErrorCode::IoError, "open() failed for fsync: " + p.string()};
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::IoError, "fsync() failed for: " + p.string()};
    }
    ::close(fd);
    return Result<void>{};
}

Result<void> set_times(const fs::path& p, const struct timespec& atime,
                       const struct timespec& mtime) {
    struct timespec times[2] = {atime, mtime};
    if (::utimensat(AT_FDCWD, p.c_str(), times, 0) != 0) {
        return Error{ErrorCode::IoError,
                     "utimensat() failed for " + p.string() + ": " + std::strerror(errno)};
    }
    return Result<void>{};
}

// Copy file contents and ensure durability (fsync destination). Replace if exists.
Result<void> copy_file_fsync_replace(const fs::path& src, const fs::path& dst) {
    std::error_code ec;
    fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return Error{ErrorCode::WriteError,
                     "copy " + src.string() + " -> " + dst.string() + ": " + ec.message()};
    }
    return fsync_file(dst);
}

} // namespace

class LocalFileSystem final : public IFileSystem {
public:
    bool exists(const fs::path& path) const override {
        std::error_code ec;
        return fs::exists(path, ec);
    }

    std::optional<FileStat> stat(const fs::path& path) const override {
        struct ::stat st{};
        if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
            return std::nullopt;
        }
        FileStat out;
        out.path = path;
        out.sizeBytes = static_cast<std::uint64_t>(st.st_size);
        out.mtime = from_timespec(st.st_mtim);
        return out;
    }

    Result<std::uint64_t> freeSpace(const fs::path& dir) const override {
        std::error_code ec;
        auto info = fs::space(dir, ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "Failed to query free space of " + dir.string() + ": " + ec.message()};
        }
        return static_cast<std::uint64_t>(info.available);
    }

    Result<std::vector<FileStat>> listFiles(const fs::path& dir,
                                            const std::set<std::string>& extensions) const override {
        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "Failed to list " + dir.string() + ": " + ec.message()};
        }

        std::vector<FileStat> out;
        for (fs::directory_iterator end; it != end; it.increment(ec)) {
            const auto& path = it->path();
            if (!extensions.empty() && extensions.count(lower_extension(path)) == 0)
                continue;
            auto st = stat(path);
            if (st) {
                out.push_back(std::move(*st));
            }
        }
        if (ec) {
            return Error{ErrorCode::IoError,
                         "Failed to list " + dir.string() + ": " + ec.message()};
        }
        return out;
    }

    Result<std::string> checksum(const fs::path& path) const override {
        return fileChecksum(path, HashAlgo::Md5);
    }

    Result<void> remove(const fs::path& path) override {
        std::error_code ec;
        if (!fs::remove(path, ec) && ec) {
            return Error{ErrorCode::IoError,
                         "Failed to remove " + path.string() + ": " + ec.message()};
        }
        return Result<void>{};
    }

    Result<void> rename(const fs::path& from, const fs::path& to) override {
        auto synced = fsync_file(from);
        if (!synced)
            return synced;

        std::error_code ec;
        fs::rename(from, to, ec);
        if (!ec)
            return Result<void>{};

        if (ec != std::errc::cross_device_link) {
            return Error{ErrorCode::IoError, "rename() failed (" + ec.message() + ") from " +
                                                 from.string() + " to " + to.string()};
        }

        spdlog::warn("Cross-device rename detected; performing copy+fsync+remove for {}",
                     to.string());
        auto copied = copy_file_fsync_replace(from, to);
        if (!copied)
            return copied;
        auto st = stat(from);
        if (st) {
            auto ts = to_timespec(st->mtime);
            auto r = set_times(to, ts, ts);
            if (!r)
                return r;
        }
        return remove(from);
    }

    Result<void> setMtime(const fs::path& path, TimePoint mtime) override {
        auto ts = to_timespec(mtime);
        return set_times(path, ts, ts);
    }

    Result<void> copyWithMetadata(const fs::path& from, const fs::path& to) override {
        struct ::stat st{};
        if (::stat(from.c_str(), &st) != 0) {
            return Error{ErrorCode::FileNotFound,
                         "Failed to stat " + from.string() + ": " + std::strerror(errno)};
        }

        auto copied = copy_file_fsync_replace(from, to);
        if (!copied)
            return copied;

        std::error_code ec;
        fs::permissions(to, static_cast<fs::perms>(st.st_mode & 07777), fs::perm_options::replace,
                        ec);
        if (ec) {
            spdlog::debug("Failed to copy permissions to {}: {}", to.string(), ec.message());
        }
        return set_times(to, st.st_atim, st.st_mtim);
    }
};

std::unique_ptr<IFileSystem> makeLocalFileSystem() {
    return std::make_unique<LocalFileSystem>();
}

} // namespace mediasync::sync
