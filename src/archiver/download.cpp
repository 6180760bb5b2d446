#include <ytarchive/archiver/download.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <condition_variable>
#include <mutex>

namespace ytarchive::archiver {

std::string watchUrl(std::string_view videoId) {
    std::string url(kWatchUrlPrefix);
    url.append(videoId);
    return url;
}

std::filesystem::path outputTemplate(const std::filesystem::path& root,
                                     const std::string& channelId, const std::string& videoId) {
    return root / channelId / (videoId + ".%(ext)s");
}

std::vector<std::string> buildDownloadArgs(const DownloadOptions& opts, std::string_view videoId,
                                           const std::filesystem::path& outputPath) {
    std::vector<std::string> args{
        opts.downloader.string(), "-o", outputPath.string(), "--merge-output-format",
        opts.mergeOutputFormat,
    };
    if (opts.writeInfoJson) {
        args.emplace_back("--write-info-json");
    }
    args.push_back(watchUrl(videoId));
    return args;
}

namespace {

// Sleeps for d unless a stop is requested first. Returns false when stopped.
bool sleepUnlessStopped(std::chrono::milliseconds d, const std::stop_token& stop) {
    if (d.count() <= 0)
        return !stop.stop_requested();
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock lock(m);
    cv.wait_for(lock, stop, d, [] { return false; });
    return !stop.stop_requested();
}

} // namespace

Result<void> downloadVideo(IProcessRunner& runner, const DownloadOptions& opts,
                           const std::string& videoId, const std::filesystem::path& outputPath,
                           std::stop_token stop) {
    const auto args = buildDownloadArgs(opts, videoId, outputPath);
    const bool forever = opts.maxRetries == kRetryForever;
    const long long attempts = forever ? 0 : static_cast<long long>(std::max(opts.maxRetries, 0)) + 1;

    Error last{ErrorCode::DownloadFailed, "youtube downloader error: no attempt made"};
    auto backoff = opts.initialBackoff;
    for (long long attempt = 1; forever || attempt <= attempts; ++attempt) {
        if (attempt > 1) {
            if (!sleepUnlessStopped(backoff, stop)) {
                return wrapError(last, "cancelled after " + std::to_string(attempt - 1) +
                                           " attempt(s)");
            }
            auto next = std::chrono::milliseconds(
                static_cast<long long>(static_cast<double>(backoff.count()) *
                                       opts.backoffMultiplier));
            backoff = std::min(next, opts.maxBackoff);
        }

        auto rc = runner.run(args);
        if (!rc) {
            last = Error{rc.error().code == ErrorCode::SpawnFailed ? ErrorCode::SpawnFailed
                                                                   : ErrorCode::DownloadFailed,
                         "youtube downloader error: " + rc.error().message};
        } else if (rc.value() != 0) {
            last = Error{ErrorCode::DownloadFailed,
                         "youtube downloader error: " + opts.downloader.string() +
                             " exited with code " + std::to_string(rc.value())};
        } else {
            if (attempt > 1) {
                spdlog::info("Downloaded {} after {} attempts", videoId, attempt);
            }
            return {};
        }

        spdlog::debug("Download attempt {} for {} failed: {}", attempt, videoId, last.message);
    }
    return last;
}

Result<void> checkDownloader(IProcessRunner& runner, const std::filesystem::path& downloader) {
    auto rc = runner.run({downloader.string(), "--version"});
    if (!rc) {
        return Error{ErrorCode::DownloaderUnavailable,
                     "downloader " + downloader.string() + ": " + rc.error().message};
    }
    if (rc.value() != 0) {
        return Error{ErrorCode::DownloaderUnavailable,
                     "downloader " + downloader.string() + ": abnormal termination (exit code " +
                         std::to_string(rc.value()) + ")"};
    }
    return {};
}

} // namespace ytarchive::archiver
