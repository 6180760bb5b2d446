#pragma once

#include <ytarchive/core/types.h>

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace ytarchive::archiver {

struct Job {
    std::string videoId;
    std::string channelId;
    std::filesystem::path outputPath;
};

struct VideoFailure {
    std::string videoId;
    Error error;
};

using JobFn = std::function<Result<void>(const Job&, std::stop_token)>;

/**
 * Fixed-size fan-out/fan-in pool for download jobs.
 *
 * - submit() blocks while the queue holds `workers` pending jobs (backpressure).
 * - close() tells workers no more jobs are coming; calling it twice throws std::logic_error.
 * - awaitCompletion() must follow close(); it returns once every worker has reported its
 *   failure list (exactly one report per worker).
 *
 * Cancellation is cooperative: a worker checks the stop token after finishing a job and never
 * interrupts one in flight. Jobs still queued when all workers have stopped are reported as
 * OperationCancelled failures so callers can roll back their bookkeeping.
 */
class ArchiveMultiplexer {
public:
    ArchiveMultiplexer(std::size_t workers, JobFn fn, std::stop_token cancel = {});
    ~ArchiveMultiplexer();

    ArchiveMultiplexer(const ArchiveMultiplexer&) = delete;
    ArchiveMultiplexer& operator=(const ArchiveMultiplexer&) = delete;
    ArchiveMultiplexer(ArchiveMultiplexer&&) = delete;
    ArchiveMultiplexer& operator=(ArchiveMultiplexer&&) = delete;

    // Returns false when the job was not accepted because every worker has stopped.
    [[nodiscard]] bool submit(Job job);

    void close();

    std::vector<VideoFailure> awaitCompletion();

    std::size_t workers() const noexcept { return workerCount_; }

private:
    void workerLoop();
    void joinAll();

    const std::size_t workerCount_;
    JobFn fn_;
    std::stop_token cancel_;

    std::mutex mutex_;
    std::condition_variable_any notEmpty_;
    std::condition_variable notFull_;
    std::condition_variable reported_;
    std::deque<Job> queue_;
    bool closed_{false};
    bool awaited_{false};
    std::size_t live_{0};
    std::vector<std::vector<VideoFailure>> reports_;

    std::vector<std::jthread> threads_;
};

} // namespace ytarchive::archiver
