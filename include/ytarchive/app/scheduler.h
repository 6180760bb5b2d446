#pragma once

#include <ytarchive/archiver/archiver.h>
#include <ytarchive/core/types.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>

namespace ytarchive::app {

// Builds a replacement archiver from freshly loaded configuration (SIGHUP).
using ReloadFn = std::function<Result<std::unique_ptr<archiver::Archiver>>()>;

/**
 * Drives archive cycles for the daemon.
 *
 * The io_context thread (the one calling run()) owns the interval timer and the signal set and
 * only posts work; cycles and reloads execute on a single runner thread, so they never overlap.
 *
 *   SIGALRM          run a cycle now
 *   SIGHUP           reload; on failure the current archiver is kept
 *   SIGINT/SIGTERM   stop the active cycle, wait for in-flight downloads, return
 */
class Scheduler {
public:
    Scheduler(std::unique_ptr<archiver::Archiver> archiver, std::chrono::seconds interval,
              ReloadFn reload = {});
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Runs the first cycle immediately, then one per interval. Blocks until stop().
    void run();

    // Thread-safe.
    void stop();
    void triggerRun();
    void triggerReload();

    std::size_t completedRuns() const noexcept { return completedRuns_.load(); }
    std::size_t failedRuns() const noexcept { return failedRuns_.load(); }

private:
    void armTimer();
    void waitSignal();
    void runCycle();
    void reload();
    std::shared_ptr<archiver::Archiver> current();

    boost::asio::io_context io_;
    boost::asio::signal_set signals_;
    boost::asio::steady_timer timer_;
    boost::asio::thread_pool runner_{1};

    std::chrono::seconds interval_;
    ReloadFn reload_;

    std::mutex mutex_;
    std::shared_ptr<archiver::Archiver> archiver_;

    std::atomic<bool> pending_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<std::size_t> completedRuns_{0};
    std::atomic<std::size_t> failedRuns_{0};
};

} // namespace ytarchive::app
