#pragma once

/*
 * mediasync - Public Types and Service Interfaces (C++20)
 *
 * This header defines the data types and abstract interfaces shared by the sync subsystem.
 * It intentionally contains no implementation details.
 *
 * Design principles:
 * - The managed directory is always safe to resume: transfers land in "<name>.part" and are
 *   renamed into place only after they were accepted
 * - Final files carry the publish date as mtime; eviction orders files by that date
 * - Eviction never removes content at least as new as the item it makes room for
 * - Clear separation of concerns (HTTP adapter, transfer engine, integrity verification,
 *   filesystem access, reconciliation, eviction)
 */

#include <mediasync/core/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mediasync::sync {

// ================================
// Fundamental enums and constants
// ================================

/**
 * Hash algorithms supported for integrity verification.
 * Catalog digests are MD5; it is used for compatibility, not for security.
 */
enum class HashAlgo { Md5, Sha256 };

/**
 * Suffix appended to the final file name while a transfer is in flight.
 */
inline constexpr std::string_view kStagingSuffix = ".part";

/**
 * Verbosity tiers derived from Settings::quiet.
 */
inline constexpr int kQuietVerbose = 1; // messages shown only when quiet < 1
inline constexpr int kQuietNormal = 2;  // messages shown when quiet < 2

// ===================
// Small data objects
// ===================

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * Checksum descriptor (algorithm + hex digest).
 */
struct Checksum {
    HashAlgo algo{HashAlgo::Md5};
    std::string hex; // lower-case hex
};

/**
 * One remote media file described by the catalog.
 */
struct MediaDescriptor {
    std::string url;
    std::string filename;
    std::string displayName;
    std::optional<std::uint64_t> expectedSizeBytes{};
    std::optional<std::string> expectedChecksum{}; // MD5 hex
    std::optional<TimePoint> publishDate{};
    std::map<std::string, std::string> subtitleUrlsByLanguage;
};

/**
 * Size and modification time of a file on disk.
 */
struct FileStat {
    std::filesystem::path path;
    std::uint64_t sizeBytes{0};
    TimePoint mtime{};
};

/**
 * Run settings, read-only during a pass.
 */
struct Settings {
    std::filesystem::path mediaDir{"."};
    std::uint64_t keepFreeBytes{0}; // 0 = eviction disabled
    double rateLimitMBps{0.0};      // 0 = unlimited
    bool verifyChecksums{false};
    bool fixBroken{false};
    int quiet{0}; // 0 verbose, 1 normal, 2+ silent

    std::set<std::string> subtitleLanguages;
    bool subtitlesForPrimaryLanguage{false};
    std::string primaryLanguage{"E"};

    std::optional<std::filesystem::path> importDir{};
    bool diskWarning{true};
    std::set<std::string> mediaExtensions{".mp4"};

    [[nodiscard]] bool verbose() const noexcept { return quiet < kQuietVerbose; }
    [[nodiscard]] bool normal() const noexcept { return quiet < kQuietNormal; }
    [[nodiscard]] bool subtitlesRequested() const noexcept {
        return subtitlesForPrimaryLanguage || !subtitleLanguages.empty();
    }
};

/**
 * Transfer options for a single GET.
 */
struct TransferOptions {
    bool resume{false};
    double rateLimitMBps{0.0};
    bool showProgress{false};
};

/**
 * Byte counters reported by a finished transfer.
 */
struct TransferStats {
    std::uint64_t startOffset{0};
    std::uint64_t bytesReceived{0};
    std::optional<std::uint64_t> totalBytes{};
};

/**
 * Status line and size of an HTTP response, reported before the first body byte.
 */
struct HttpResponseInfo {
    long status{0};
    std::optional<std::uint64_t> contentLength{};
};

/**
 * Result of syncing one media item.
 */
enum class SyncOutcome { Synced, Failed };

/**
 * Tagged outcome of the space evictor.
 * - Proceed: enough free space, the reference item may be transferred
 * - SkipMissingTimestamp: space is needed but the reference has no date; skip the item
 * - HaltLimitReached: only equally-new or newer content is left; stop the pass
 */
enum class EvictionOutcome { Proceed, SkipMissingTimestamp, HaltLimitReached };

/**
 * The item eviction makes room for.
 */
struct EvictionReference {
    std::string name;
    std::uint64_t sizeBytes{0};
    std::optional<TimePoint> date{};
};

struct SyncSummary {
    std::size_t total{0};
    std::size_t alreadyValid{0};
    std::size_t synced{0};
    std::size_t failed{0};
    std::size_t skipped{0};
    bool halted{false};
};

struct ImportSummary {
    std::size_t candidates{0};
    std::size_t copied{0};
    std::size_t skipped{0};
    bool halted{false};
};

struct SubtitleSummary {
    std::size_t queued{0};
    std::size_t downloaded{0};
};

// ===================
// Callback signatures
// ===================

using ByteSink = std::function<Result<void>(std::span<const std::byte>)>;
using ResponseCallback = std::function<Result<void>(const HttpResponseInfo&)>;
using SleepFunction = std::function<void(std::chrono::milliseconds)>;
using ConfirmCallback = std::function<bool(const std::string& prompt)>;
using LanguageLookup = std::function<std::optional<std::string>(const std::string& tag)>;

// ==========================
// Service interface classes
// ==========================

/**
 * HTTP adapter abstraction (libcurl-based implementation satisfies this).
 */
class IHttpAdapter {
public:
    virtual ~IHttpAdapter() = default;

    /**
     * Issue a GET and stream the body to the sink.
     * onResponse is called once per request, before the first body byte.
     * Returns an error for transport failures, sink errors and HTTP status >= 400.
     */
    virtual Result<void> get(std::string_view url, const std::vector<Header>& headers,
                             const ResponseCallback& onResponse, const ByteSink& sink) = 0;
};

/**
 * Integrity verifier interface (streaming hash calculator).
 */
class IIntegrityVerifier {
public:
    virtual ~IIntegrityVerifier() = default;
    virtual void reset(HashAlgo algo) = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    virtual Checksum finalize() = 0;
};

/**
 * Every filesystem query and mutation the sync core performs.
 */
class IFileSystem {
public:
    virtual ~IFileSystem() = default;

    virtual bool exists(const std::filesystem::path& path) const = 0;

    /**
     * Size and mtime of a regular file; std::nullopt when it does not exist.
     */
    virtual std::optional<FileStat> stat(const std::filesystem::path& path) const = 0;

    /**
     * Free bytes on the volume holding dir.
     */
    virtual Result<std::uint64_t> freeSpace(const std::filesystem::path& dir) const = 0;

    /**
     * Regular files directly inside dir whose extension is in extensions.
     */
    virtual Result<std::vector<FileStat>>
    listFiles(const std::filesystem::path& dir, const std::set<std::string>& extensions) const = 0;

    /**
     * Lowercase hex MD5 of the file content.
     */
    virtual Result<std::string> checksum(const std::filesystem::path& path) const = 0;

    virtual Result<void> remove(const std::filesystem::path& path) = 0;
    virtual Result<void> rename(const std::filesystem::path& from,
                                const std::filesystem::path& to) = 0;
    virtual Result<void> setMtime(const std::filesystem::path& path, TimePoint mtime) = 0;

    /**
     * Copy content, mtime and permissions; replaces an existing destination.
     */
    virtual Result<void> copyWithMetadata(const std::filesystem::path& from,
                                          const std::filesystem::path& to) = 0;
};

/**
 * Single-stream GET into a local file (append or truncate).
 */
class ITransferEngine {
public:
    virtual ~ITransferEngine() = default;
    virtual Result<TransferStats> transfer(const std::string& url,
                                           const std::filesystem::path& destination,
                                           const TransferOptions& options) = 0;
};

// ======================
// Utility path builders
// ======================

/**
 * Canonical location of a media item inside the managed directory.
 */
[[nodiscard]] inline std::filesystem::path finalPathFor(const Settings& settings,
                                                        const MediaDescriptor& media) {
    return settings.mediaDir / media.filename;
}

/**
 * Staging variant of a final path: "<final>.part".
 */
[[nodiscard]] inline std::filesystem::path stagingPathFor(const std::filesystem::path& finalPath) {
    auto staging = finalPath;
    staging += std::string(kStagingSuffix);
    return staging;
}

/**
 * Last path component of a URL with query and fragment removed and %XX sequences decoded.
 */
[[nodiscard]] std::string urlBasename(std::string_view url);

// ======================
// Factories and helpers
// ======================

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter();
std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifier(HashAlgo algo = HashAlgo::Md5);
std::unique_ptr<IFileSystem> makeLocalFileSystem();

/**
 * Hex digest of a file, streamed in CHECKSUM_BLOCK_SIZE blocks.
 */
Result<std::string> fileChecksum(const std::filesystem::path& path,
                                 HashAlgo algo = HashAlgo::Md5);

/**
 * Case-insensitive comparison of two hex digests.
 */
[[nodiscard]] bool checksumEquals(std::string_view a, std::string_view b) noexcept;

/**
 * Remaining time of a pacing budget; never negative.
 */
[[nodiscard]] std::chrono::milliseconds pacingDelay(std::chrono::milliseconds elapsed,
                                                    std::chrono::milliseconds budget) noexcept;

} // namespace mediasync::sync
