#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <ytarchive/archiver/channel_cache.h>

#include "support/fakes.hpp"

#include <string>
#include <vector>

using namespace ytarchive;
using namespace ytarchive::archiver;
using Catch::Matchers::ContainsSubstring;
using ytarchive::test_support::FakeYouTubeApi;
using ytarchive::test_support::video;

namespace {

CachedChannel channelWithFeed(const std::string& feed) {
    CachedChannel ch;
    ch.id = "UC1";
    ch.name = "Channel One";
    ch.uploadsFeedId = feed;
    return ch;
}

VisitFn collectInto(std::vector<std::string>& out) {
    return [&out](CachedChannel&, const api::VideoRecord& v) -> Result<void> {
        out.push_back(v.videoId);
        return {};
    };
}

} // namespace

TEST_CASE("CachedChannel: seen bookkeeping", "[archiver][cache]") {
    CachedChannel ch;
    CHECK_FALSE(ch.seen.has_value());
    CHECK_FALSE(ch.hasSeen("a"));

    ch.unmarkSeen("a");
    CHECK_FALSE(ch.seen.has_value());

    ch.markSeen("a");
    REQUIRE(ch.seen.has_value());
    CHECK(ch.hasSeen("a"));

    ch.unmarkSeen("a");
    ch.unmarkSeen("a");
    CHECK(ch.seen.has_value());
    CHECK(ch.seen->empty());
}

TEST_CASE("resolveChannel: caches metadata or fails with context", "[archiver][cache]") {
    FakeYouTubeApi api;
    api.addChannel("@one", "UC1", "Channel One", "UU1");

    SECTION("found") {
        api::ChannelIdentity who;
        who.handle = "@one";
        auto r = resolveChannel(api, who);
        REQUIRE(r);
        CHECK(r.value().id == "UC1");
        CHECK(r.value().uploadsFeedId == "UU1");
        CHECK_FALSE(r.value().seen.has_value());
    }

    SECTION("not found") {
        api::ChannelIdentity who;
        who.handle = "@missing";
        auto r = resolveChannel(api, who);
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::NotFound);
        CHECK_THAT(r.error().message, ContainsSubstring("caching @missing"));
    }

    SECTION("ambiguous identity is rejected before the API call") {
        api::ChannelIdentity who;
        who.handle = "@one";
        who.username = "one";
        auto r = resolveChannel(api, who);
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::AmbiguousIdentity);
        CHECK(api.lookupCalls == 0);
    }
}

TEST_CASE("enumerateUploads: history depth follows seen", "[archiver][cache]") {
    FakeYouTubeApi api;
    api.feeds["UU1"] = {{video("v5"), video("v4")}, {video("v3"), video("v2")}, {video("v1")}};

    SECTION("seen unset walks every page") {
        auto ch = channelWithFeed("UU1");
        std::vector<std::string> visited;
        REQUIRE(enumerateUploads(api, ch, collectInto(visited)));
        CHECK(visited == std::vector<std::string>{"v5", "v4", "v3", "v2", "v1"});
        CHECK(api.pageCalls == 3);
        CHECK(api.statusCalls == 3);
    }

    SECTION("seen set walks the first page only") {
        auto ch = channelWithFeed("UU1");
        ch.seen.emplace();
        std::vector<std::string> visited;
        REQUIRE(enumerateUploads(api, ch, collectInto(visited)));
        CHECK(visited == std::vector<std::string>{"v5", "v4"});
        CHECK(api.pageCalls == 1);
    }

    SECTION("depth is decided on entry") {
        auto ch = channelWithFeed("UU1");
        std::vector<std::string> visited;
        auto visit = [&visited](CachedChannel& c, const api::VideoRecord& v) -> Result<void> {
            c.markSeen(v.videoId);
            visited.push_back(v.videoId);
            return {};
        };
        REQUIRE(enumerateUploads(api, ch, visit));
        CHECK(visited.size() == 5);
    }
}

TEST_CASE("enumerateUploads: upcoming and live videos are skipped", "[archiver][cache]") {
    FakeYouTubeApi api;
    api.feeds["UU1"] = {{video("a"), video("b"), video("c"), video("d")}};
    api.live["b"] = api::LiveStatus::Upcoming;
    api.live["c"] = api::LiveStatus::Live;
    api.live["d"] = api::LiveStatus::Completed;

    auto ch = channelWithFeed("UU1");
    std::vector<std::string> visited;
    REQUIRE(enumerateUploads(api, ch, collectInto(visited)));
    CHECK(visited == std::vector<std::string>{"a", "d"});
    CHECK_FALSE(ch.hasSeen("b"));
    CHECK_FALSE(ch.hasSeen("c"));
}

TEST_CASE("enumerateUploads: failures", "[archiver][cache]") {
    FakeYouTubeApi api;
    auto ch = channelWithFeed("UU1");
    std::vector<std::string> visited;

    SECTION("empty first page is EmptyResults") {
        api.feeds["UU1"] = {};
        auto r = enumerateUploads(api, ch, collectInto(visited));
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::EmptyResults);
    }

    SECTION("visit error halts the walk") {
        api.feeds["UU1"] = {{video("a"), video("b")}, {video("c")}};
        auto visit = [&visited](CachedChannel&, const api::VideoRecord& v) -> Result<void> {
            visited.push_back(v.videoId);
            if (v.videoId == "a")
                return Error{ErrorCode::OperationCancelled, "stop"};
            return {};
        };
        auto r = enumerateUploads(api, ch, visit);
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::OperationCancelled);
        CHECK_THAT(r.error().message, ContainsSubstring("foreach video on UC1"));
        CHECK(visited == std::vector<std::string>{"a"});
        CHECK(api.pageCalls == 1);
    }

    SECTION("feed error is wrapped with channel context") {
        api.feedError = Error{ErrorCode::HttpError, "list playlist items: http status 403"};
        auto r = enumerateUploads(api, ch, collectInto(visited));
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::HttpError);
        CHECK_THAT(r.error().message, ContainsSubstring("UC1"));
    }

    SECTION("status lookup error halts the walk") {
        api.feeds["UU1"] = {{video("a")}};
        api.statusError = Error{ErrorCode::NetworkError, "check upcoming: timeout"};
        auto r = enumerateUploads(api, ch, collectInto(visited));
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::NetworkError);
        CHECK(visited.empty());
    }
}
