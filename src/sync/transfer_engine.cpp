/*
 * mediasync/src/sync/transfer_engine.cpp
 *
 * TransferEngine (single stream, resumable, throttled):
 * - Opens the destination in append mode when resuming, truncate mode otherwise
 * - Always asks the server to skip what is already on disk ("Range: bytes=N-")
 * - Re-chunks the response stream into rate-sized blocks and flushes each block
 * - Sleeps for the remainder of each block's one second budget when rate limited
 * - Draws a 70 column progress bar on an interactive stderr
 *
 * No retry: transport and write errors are returned to the caller.
 */

#include <mediasync/sync/transfer_engine.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iostream>
#include <thread>
#include <vector>

#include <unistd.h>

namespace mediasync::sync {

namespace fs = std::filesystem;

std::string formatProgressLine(std::uint64_t doneBytes, std::uint64_t totalBytes) {
    if (totalBytes == 0)
        return std::string{};
    const double percent =
        100.0 * static_cast<double>(doneBytes) / static_cast<double>(totalBytes);
    const auto hashes = std::min<std::uint64_t>(kProgressBarWidth * doneBytes / totalBytes,
                                                kProgressBarWidth);
    const std::string bar(static_cast<std::size_t>(hashes), '#');
    return fmt::format("\r{:-<70} {:>5.1f}%", bar, percent);
}

TransferEngine::TransferEngine(IHttpAdapter& http, SleepFunction sleep)
    : http_(http), sleep_(std::move(sleep)), progressOut_(&std::cerr),
      progressInteractive_(::isatty(STDERR_FILENO) != 0) {
    if (!sleep_) {
        sleep_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

void TransferEngine::setProgressStream(std::ostream& out, bool interactive) {
    progressOut_ = &out;
    progressInteractive_ = interactive;
}

std::size_t TransferEngine::chunkSizeFor(double rateLimitMBps) noexcept {
    if (rateLimitMBps > 0.0) {
        auto size = static_cast<std::size_t>(rateLimitMBps * static_cast<double>(MiB));
        return std::max<std::size_t>(size, 1);
    }
    return DEFAULT_TRANSFER_CHUNK_SIZE;
}

Result<TransferStats> TransferEngine::transfer(const std::string& url,
                                               const fs::path& destination,
                                               const TransferOptions& options) {
    TransferStats stats;

    std::error_code ec;
    if (options.resume && fs::exists(destination, ec)) {
        auto size = fs::file_size(destination, ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "Failed to stat " + destination.string() + ": " + ec.message()};
        }
        stats.startOffset = static_cast<std::uint64_t>(size);
    }

    auto openMode = std::ios::binary | std::ios::out |
                    (stats.startOffset > 0 ? std::ios::app : std::ios::trunc);
    std::ofstream out(destination, openMode);
    if (!out) {
        return Error{ErrorCode::WriteError, "Failed to open " + destination.string()};
    }

    const std::size_t chunkSize = chunkSizeFor(options.rateLimitMBps);
    const bool throttled = options.rateLimitMBps > 0.0;

    std::uint64_t done = stats.startOffset;
    std::vector<char> chunk;
    chunk.reserve(chunkSize);
    bool progress = false;
    std::uint64_t total = 0;
    auto chunkStarted = std::chrono::steady_clock::now();

    auto render = [&]() {
        if (progress) {
            *progressOut_ << formatProgressLine(done, total) << std::flush;
        }
    };

    auto writeChunk = [&]() -> Result<void> {
        if (chunk.empty())
            return Result<void>{};
        out.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        out.flush();
        if (!out) {
            return Error{ErrorCode::WriteError, "Write failed on " + destination.string()};
        }
        done += chunk.size();
        stats.bytesReceived += chunk.size();
        chunk.clear();
        return Result<void>{};
    };

    auto finishChunk = [&]() -> Result<void> {
        auto wr = writeChunk();
        if (!wr)
            return wr;
        if (throttled) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - chunkStarted);
            auto wait = pacingDelay(elapsed, kChunkBudget);
            if (wait.count() > 0)
                sleep_(wait);
        }
        render();
        chunkStarted = std::chrono::steady_clock::now();
        return Result<void>{};
    };

    auto onResponse = [&](const HttpResponseInfo& info) -> Result<void> {
        if (done > 0 && info.status == 200) {
            // Range ignored: the body starts at byte zero, start the file over
            spdlog::debug("server ignored range request for {}, restarting from zero", url);
            out.close();
            out.open(destination, std::ios::binary | std::ios::out | std::ios::trunc);
            if (!out) {
                return Error{ErrorCode::WriteError, "Failed to reopen " + destination.string()};
            }
            done = 0;
            stats.startOffset = 0;
        }
        if (info.contentLength) {
            stats.totalBytes = *info.contentLength + done;
        }
        if (options.showProgress && progressInteractive_ && stats.totalBytes &&
            *stats.totalBytes > 0) {
            progress = true;
            total = *stats.totalBytes;
        }
        render();
        chunkStarted = std::chrono::steady_clock::now();
        return Result<void>{};
    };

    auto sink = [&](std::span<const std::byte> data) -> Result<void> {
        const char* p = reinterpret_cast<const char*>(data.data());
        std::size_t remaining = data.size();
        while (remaining > 0) {
            const std::size_t take = std::min(chunkSize - chunk.size(), remaining);
            chunk.insert(chunk.end(), p, p + take);
            p += take;
            remaining -= take;
            if (chunk.size() == chunkSize) {
                auto r = finishChunk();
                if (!r)
                    return r;
            }
        }
        return Result<void>{};
    };

    std::vector<Header> headers{{"Range", "bytes=" + std::to_string(stats.startOffset) + "-"}};
    auto res = http_.get(url, headers, onResponse, sink);
    if (!res) {
        // Keep whatever arrived intact so the next run can resume after it
        if (!chunk.empty()) {
            auto wr = writeChunk();
            if (!wr) {
                spdlog::debug("failed to keep partial chunk of {}: {}", destination.string(),
                              wr.error().message);
            }
        }
        if (progress)
            *progressOut_ << std::endl;
        return res.error();
    }

    if (!chunk.empty()) {
        auto last = finishChunk();
        if (!last) {
            return last.error();
        }
    }
    if (progress)
        *progressOut_ << std::endl;

    return stats;
}

} // namespace mediasync::sync
