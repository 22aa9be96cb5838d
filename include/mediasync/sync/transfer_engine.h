#pragma once

#include <mediasync/sync/sync.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string>

namespace mediasync::sync {

/**
 * Throttled, resumable single-stream transfer into a local file.
 *
 * The body is cut into chunks of rateLimit MiB (1 MiB when unlimited). Every chunk is written
 * and flushed before the next one is filled, so an aborted transfer loses at most one chunk.
 * With a rate limit each chunk gets a one second budget and the engine sleeps for whatever is
 * left of it.
 */
class TransferEngine final : public ITransferEngine {
public:
    /**
     * http must outlive the engine. An empty sleep function uses std::this_thread::sleep_for.
     */
    explicit TransferEngine(IHttpAdapter& http, SleepFunction sleep = {});

    Result<TransferStats> transfer(const std::string& url,
                                   const std::filesystem::path& destination,
                                   const TransferOptions& options) override;

    /**
     * Redirect the progress line (defaults to std::cerr, interactive when stderr is a TTY).
     */
    void setProgressStream(std::ostream& out, bool interactive);

    [[nodiscard]] static std::size_t chunkSizeFor(double rateLimitMBps) noexcept;

private:
    IHttpAdapter& http_;
    SleepFunction sleep_;
    std::ostream* progressOut_;
    bool progressInteractive_;
};

/**
 * One progress line: "\r" + '#' bar padded with '-' to 70 columns + " " + "%5.1f%".
 */
[[nodiscard]] std::string formatProgressLine(std::uint64_t doneBytes, std::uint64_t totalBytes);

inline constexpr std::size_t kProgressBarWidth = 70;
inline constexpr std::chrono::milliseconds kChunkBudget{1000};

} // namespace mediasync::sync
