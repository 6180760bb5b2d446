#pragma once

#include <ytarchive/core/types.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace ytarchive::archiver {

/**
 * Runs an external program to completion. Returns the exit code; spawn failures and abnormal
 * termination (signals) are errors.
 */
class IProcessRunner {
public:
    virtual ~IProcessRunner() = default;
    virtual Result<int> run(const std::vector<std::string>& argv) = 0;
};

// fork/execvp/waitpid runner. quiet redirects the child's stdout to /dev/null.
std::shared_ptr<IProcessRunner> makePosixProcessRunner(bool quiet = true);

// max_retries sentinel: retry until the download succeeds.
inline constexpr int kRetryForever = -1;

inline constexpr std::string_view kWatchUrlPrefix = "https://youtube.com/watch?v=";

struct DownloadOptions {
    std::filesystem::path downloader{"/usr/bin/yt-dlp"};
    // Retries after the first attempt: 0 = single attempt, kRetryForever = unbounded.
    int maxRetries{3};
    std::chrono::milliseconds initialBackoff{2000};
    double backoffMultiplier{2.0};
    std::chrono::milliseconds maxBackoff{60000};
    std::string mergeOutputFormat{"mp4"};
    bool writeInfoJson{false};
};

std::string watchUrl(std::string_view videoId);

// <root>/<channelId>/<videoId>.%(ext)s, expanded by the downloader to <videoId>.<ext>.
std::filesystem::path outputTemplate(const std::filesystem::path& root,
                                     const std::string& channelId, const std::string& videoId);

std::vector<std::string> buildDownloadArgs(const DownloadOptions& opts, std::string_view videoId,
                                           const std::filesystem::path& outputPath);

/**
 * Download one video, retrying identical invocations on spawn failure or non-zero exit.
 * Returns the last failure (DownloadFailed / SpawnFailed) once attempts are exhausted.
 * A stop request is honoured between attempts only.
 */
Result<void> downloadVideo(IProcessRunner& runner, const DownloadOptions& opts,
                           const std::string& videoId, const std::filesystem::path& outputPath,
                           std::stop_token stop = {});

// Runs "<downloader> --version"; fails with DownloaderUnavailable unless it exits 0.
Result<void> checkDownloader(IProcessRunner& runner, const std::filesystem::path& downloader);

} // namespace ytarchive::archiver
