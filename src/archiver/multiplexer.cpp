#include <ytarchive/archiver/multiplexer.h>

#include <spdlog/spdlog.h>

#include <exception>
#include <stdexcept>

namespace ytarchive::archiver {

ArchiveMultiplexer::ArchiveMultiplexer(std::size_t workers, JobFn fn, std::stop_token cancel)
    : workerCount_(workers == 0 ? 1 : workers), fn_(std::move(fn)), cancel_(std::move(cancel)) {
    reports_.reserve(workerCount_);
    live_ = workerCount_;
    threads_.reserve(workerCount_);
    for (std::size_t i = 0; i < workerCount_; ++i) {
        threads_.emplace_back([this] { workerLoop(); });
    }
    spdlog::debug("ArchiveMultiplexer started with {} workers", workerCount_);
}

ArchiveMultiplexer::~ArchiveMultiplexer() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    notEmpty_.notify_all();
    joinAll();
}

bool ArchiveMultiplexer::submit(Job job) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (closed_) {
            throw std::logic_error("ArchiveMultiplexer: submit after close");
        }
        notFull_.wait(lock, [this] { return queue_.size() < workerCount_ || live_ == 0; });
        if (live_ == 0) {
            return false;
        }
        queue_.push_back(std::move(job));
    }
    notEmpty_.notify_one();
    return true;
}

void ArchiveMultiplexer::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            throw std::logic_error("ArchiveMultiplexer: close called twice");
        }
        closed_ = true;
    }
    notEmpty_.notify_all();
}

std::vector<VideoFailure> ArchiveMultiplexer::awaitCompletion() {
    std::vector<VideoFailure> failures;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!closed_) {
            throw std::logic_error("ArchiveMultiplexer: awaitCompletion before close");
        }
        if (awaited_) {
            throw std::logic_error("ArchiveMultiplexer: awaitCompletion called twice");
        }
        reported_.wait(lock, [this] { return reports_.size() == workerCount_; });
        awaited_ = true;

        for (auto& report : reports_) {
            for (auto& f : report) {
                failures.push_back(std::move(f));
            }
        }
        reports_.clear();

        // Workers stopped early; these jobs never ran.
        for (auto& job : queue_) {
            failures.push_back(VideoFailure{
                job.videoId, Error{ErrorCode::OperationCancelled, "download cancelled before start"}});
        }
        queue_.clear();
    }
    joinAll();
    return failures;
}

void ArchiveMultiplexer::workerLoop() {
    std::vector<VideoFailure> failures;
    for (;;) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            notEmpty_.wait(lock, cancel_, [this] { return !queue_.empty() || closed_; });
            if (queue_.empty() || cancel_.stop_requested()) {
                break;
            }
            job = std::move(queue_.front());
            queue_.pop_front();
        }
        notFull_.notify_one();

        try {
            auto r = fn_(job, cancel_);
            if (!r) {
                spdlog::warn("Download of {} failed: {}", job.videoId, r.error().message);
                failures.push_back(VideoFailure{job.videoId, r.error()});
            }
        } catch (const std::exception& e) {
            failures.push_back(
                VideoFailure{job.videoId, Error{ErrorCode::InternalError, e.what()}});
        }

        if (cancel_.stop_requested()) {
            break;
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        --live_;
        reports_.push_back(std::move(failures));
    }
    reported_.notify_all();
    notFull_.notify_all();
}

void ArchiveMultiplexer::joinAll() {
    for (auto& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
    threads_.clear();
}

} // namespace ytarchive::archiver
