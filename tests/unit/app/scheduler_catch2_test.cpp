#include <catch2/catch_test_macros.hpp>

#include <ytarchive/app/scheduler.h>

#include "support/fakes.hpp"
#include "support/temp_dir_scope.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <functional>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace ytarchive;
using namespace ytarchive::archiver;
using namespace std::chrono_literals;
using ytarchive::test_support::FakeProcessRunner;
using ytarchive::test_support::FakeYouTubeApi;
using ytarchive::test_support::TempDirScope;
using ytarchive::test_support::video;

namespace {

bool waitFor(const std::function<bool()>& pred, std::chrono::milliseconds timeout = 5s) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline)
            return false;
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

struct SchedulerFixture {
    TempDirScope tmp = TempDirScope::unique_under("ytarchive-scheduler");
    std::shared_ptr<FakeYouTubeApi> api = std::make_shared<FakeYouTubeApi>();
    std::shared_ptr<FakeProcessRunner> runner = std::make_shared<FakeProcessRunner>();

    SchedulerFixture() {
        api->addChannel("UC1", "UC1", "Channel One", "UU1");
        api->feeds["UU1"] = {{video("V1")}};
    }

    std::unique_ptr<Archiver> makeArchiver() {
        ArchiverConfig cfg;
        cfg.root = tmp.path();
        cfg.maxParallel = 1;
        api::ChannelIdentity who;
        who.id = "UC1";
        cfg.channels.push_back(ChannelConfig{who, {}});
        auto r = Archiver::create(cfg, api, runner);
        REQUIRE(r);
        return std::move(r).value();
    }
};

} // namespace

TEST_CASE("Scheduler: runs immediately, on trigger and stops cleanly", "[app][scheduler]") {
    SchedulerFixture f;
    app::Scheduler scheduler(f.makeArchiver(), std::chrono::hours(1));

    std::thread loop([&] { scheduler.run(); });

    REQUIRE(waitFor([&] { return scheduler.completedRuns() >= 1; }));
    CHECK(scheduler.failedRuns() == 0);
    CHECK(f.runner->downloadedIds() == std::vector<std::string>{"V1"});

    scheduler.triggerRun();
    REQUIRE(waitFor([&] { return scheduler.completedRuns() >= 2; }));

    scheduler.stop();
    loop.join();
    CHECK(scheduler.completedRuns() == 2);
}

TEST_CASE("Scheduler: SIGALRM runs now and SIGTERM shuts down", "[app][scheduler]") {
    SchedulerFixture f;
    app::Scheduler scheduler(f.makeArchiver(), std::chrono::hours(1));

    std::thread loop([&] { scheduler.run(); });
    REQUIRE(waitFor([&] { return scheduler.completedRuns() >= 1; }));

    std::raise(SIGALRM);
    REQUIRE(waitFor([&] { return scheduler.completedRuns() >= 2; }));

    std::raise(SIGTERM);
    loop.join();
    CHECK(scheduler.completedRuns() == 2);
}

TEST_CASE("Scheduler: failed reload keeps the current archiver", "[app][scheduler]") {
    SchedulerFixture f;
    std::atomic<int> reloads{0};
    app::Scheduler scheduler(f.makeArchiver(), std::chrono::hours(1),
                             [&reloads]() -> Result<std::unique_ptr<Archiver>> {
                                 ++reloads;
                                 return Error{ErrorCode::InvalidArgument, "config: broken"};
                             });

    std::thread loop([&] { scheduler.run(); });
    REQUIRE(waitFor([&] { return scheduler.completedRuns() >= 1; }));

    scheduler.triggerReload();
    REQUIRE(waitFor([&] { return reloads.load() == 1; }));

    // The new feed item is picked up by the archiver that survived the reload.
    f.api->feeds["UU1"] = {{video("V2"), video("V1")}};
    scheduler.triggerRun();
    REQUIRE(waitFor([&] { return scheduler.completedRuns() >= 2; }));
    CHECK(f.runner->downloadedIds() == std::vector<std::string>{"V1", "V2"});

    scheduler.stop();
    loop.join();
}

TEST_CASE("Scheduler: a throwing reload keeps the scheduler running", "[app][scheduler]") {
    SchedulerFixture f;
    std::atomic<int> reloads{0};
    app::Scheduler scheduler(f.makeArchiver(), std::chrono::hours(1),
                             [&reloads]() -> Result<std::unique_ptr<Archiver>> {
                                 ++reloads;
                                 throw std::out_of_range("stoll");
                             });

    std::thread loop([&] { scheduler.run(); });
    REQUIRE(waitFor([&] { return scheduler.completedRuns() >= 1; }));

    scheduler.triggerReload();
    REQUIRE(waitFor([&] { return reloads.load() == 1; }));

    f.api->feeds["UU1"] = {{video("V2"), video("V1")}};
    scheduler.triggerRun();
    REQUIRE(waitFor([&] { return scheduler.completedRuns() >= 2; }));
    CHECK(f.runner->downloadedIds() == std::vector<std::string>{"V1", "V2"});

    scheduler.stop();
    loop.join();
}

TEST_CASE("Scheduler: partial failures are counted", "[app][scheduler]") {
    SchedulerFixture f;
    f.api->feeds["UU1"] = {};
    app::Scheduler scheduler(f.makeArchiver(), std::chrono::hours(1));

    std::thread loop([&] { scheduler.run(); });
    REQUIRE(waitFor([&] { return scheduler.completedRuns() >= 1; }));
    CHECK(scheduler.failedRuns() == 1);

    scheduler.stop();
    loop.join();
}
