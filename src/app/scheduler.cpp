#include <ytarchive/app/scheduler.h>

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <exception>

namespace ytarchive::app {

Scheduler::Scheduler(std::unique_ptr<archiver::Archiver> archiver, std::chrono::seconds interval,
                     ReloadFn reload)
    : signals_(io_, SIGINT, SIGTERM), timer_(io_), interval_(interval),
      reload_(std::move(reload)), archiver_(std::move(archiver)) {
    signals_.add(SIGHUP);
    signals_.add(SIGALRM);
}

Scheduler::~Scheduler() {
    stop();
    runner_.join();
}

void Scheduler::run() {
    spdlog::info("Scheduler started, interval {}s", interval_.count());
    waitSignal();
    triggerRun();
    armTimer();
    io_.run();

    // Let the active cycle finish its in-flight downloads.
    runner_.join();
    spdlog::info("Scheduler stopped after {} run(s)", completedRuns_.load());
}

void Scheduler::stop() {
    if (stopping_.exchange(true)) {
        return;
    }
    spdlog::info("Stop requested");
    if (auto ar = current()) {
        ar->requestStop();
    }
    io_.stop();
}

void Scheduler::triggerRun() {
    if (stopping_.load()) {
        return;
    }
    if (pending_.exchange(true)) {
        spdlog::info("Archive run already pending, skipping trigger");
        return;
    }
    // Cleared when the cycle starts, so a trigger during a run queues exactly one more.
    boost::asio::post(runner_, [this] {
        pending_.store(false);
        runCycle();
    });
}

void Scheduler::triggerReload() {
    if (stopping_.load()) {
        return;
    }
    boost::asio::post(runner_, [this] { reload(); });
}

void Scheduler::armTimer() {
    timer_.expires_after(interval_);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        triggerRun();
        armTimer();
    });
}

void Scheduler::waitSignal() {
    signals_.async_wait([this](const boost::system::error_code& ec, int signo) {
        if (ec) {
            return;
        }
        switch (signo) {
            case SIGALRM:
                spdlog::info("SIGALRM: running archive now");
                triggerRun();
                break;
            case SIGHUP:
                spdlog::info("SIGHUP: reloading configuration");
                triggerReload();
                break;
            default:
                spdlog::info("Signal {} received, shutting down", signo);
                stop();
                return;
        }
        waitSignal();
    });
}

void Scheduler::runCycle() {
    if (stopping_.load()) {
        return;
    }
    auto ar = current();
    if (!ar) {
        return;
    }
    try {
        if (auto err = ar->archive()) {
            failedRuns_.fetch_add(1);
            spdlog::error("{}", err->describe());
        }
    } catch (const std::exception& e) {
        failedRuns_.fetch_add(1);
        spdlog::error("Archive run aborted: {}", e.what());
    }
    completedRuns_.fetch_add(1);
}

void Scheduler::reload() {
    if (!reload_) {
        spdlog::warn("Reload requested but no reload source configured");
        return;
    }
    Result<std::unique_ptr<archiver::Archiver>> next =
        Error{ErrorCode::InternalError, "reload did not run"};
    try {
        next = reload_();
    } catch (const std::exception& e) {
        spdlog::error("Reload aborted, keeping current configuration: {}", e.what());
        return;
    }
    if (!next) {
        spdlog::error("Reload failed, keeping current configuration: {}", next.error().message);
        return;
    }
    std::shared_ptr<archiver::Archiver> fresh = std::move(next).value();
    {
        std::lock_guard<std::mutex> lk(mutex_);
        archiver_ = std::move(fresh);
    }
    // A stop that raced with the swap must reach the new archiver.
    if (stopping_.load()) {
        current()->requestStop();
    }
    spdlog::info("Configuration reloaded");
}

std::shared_ptr<archiver::Archiver> Scheduler::current() {
    std::lock_guard<std::mutex> lk(mutex_);
    return archiver_;
}

} // namespace ytarchive::app
