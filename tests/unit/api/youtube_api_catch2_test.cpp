#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <ytarchive/api/youtube_api.h>

#include "support/fakes.hpp"

#include <memory>
#include <string>

using namespace ytarchive;
using namespace ytarchive::api;
using Catch::Matchers::ContainsSubstring;
using ytarchive::test_support::FakeHttpTransport;

namespace {

const char* kChannelBody = R"({
  "items": [{
    "id": "UC123",
    "snippet": {"title": "Some Channel"},
    "contentDetails": {"relatedPlaylists": {"uploads": "UU123"}}
  }]
})";

struct ApiFixture {
    std::shared_ptr<FakeHttpTransport> http = std::make_shared<FakeHttpTransport>();
    std::unique_ptr<IYouTubeApi> yt =
        makeYouTubeApi(YouTubeApiConfig{"secret", "https://api.test/v3"}, http);
};

} // namespace

TEST_CASE("decodeChannelList: extracts id, title and uploads playlist", "[api][decode]") {
    auto r = decodeChannelList(kChannelBody);
    REQUIRE(r);
    REQUIRE(r.value().size() == 1);
    CHECK(r.value()[0].id == "UC123");
    CHECK(r.value()[0].name == "Some Channel");
    CHECK(r.value()[0].uploadsFeedId == "UU123");
}

TEST_CASE("decodeChannelList: missing items is an empty list", "[api][decode]") {
    auto r = decodeChannelList(R"({"kind": "youtube#channelListResponse"})");
    REQUIRE(r);
    CHECK(r.value().empty());
}

TEST_CASE("decodeChannelList: malformed JSON is InvalidData", "[api][decode]") {
    auto r = decodeChannelList("{not json");
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::InvalidData);
}

TEST_CASE("decodePlaylistItems: ids, owner channel and page token", "[api][decode]") {
    auto r = decodePlaylistItems(R"({
      "nextPageToken": "CAUQAA",
      "items": [
        {"contentDetails": {"videoId": "v1"},
         "snippet": {"title": "First", "description": "d1", "videoOwnerChannelId": "UC1"}},
        {"snippet": {"title": "Second", "channelId": "UC2", "resourceId": {"videoId": "v2"}}},
        {"snippet": {"title": "Deleted video"}}
      ]
    })");
    REQUIRE(r);
    const auto& page = r.value();
    CHECK(page.nextPageToken == "CAUQAA");
    REQUIRE(page.items.size() == 2);
    CHECK(page.items[0].videoId == "v1");
    CHECK(page.items[0].channelId == "UC1");
    CHECK(page.items[0].description == "d1");
    CHECK(page.items[1].videoId == "v2");
    CHECK(page.items[1].channelId == "UC2");
}

TEST_CASE("decodeVideoStatuses: maps liveBroadcastContent", "[api][decode]") {
    auto r = decodeVideoStatuses(R"({"items": [
        {"id": "a", "snippet": {"liveBroadcastContent": "none"}},
        {"id": "b", "snippet": {"liveBroadcastContent": "upcoming"}},
        {"id": "c", "snippet": {"liveBroadcastContent": "live"}},
        {"id": "d", "snippet": {"liveBroadcastContent": "completed"}}
    ]})");
    REQUIRE(r);
    REQUIRE(r.value().size() == 4);
    CHECK(r.value()[0].liveStatus == LiveStatus::None);
    CHECK(r.value()[1].liveStatus == LiveStatus::Upcoming);
    CHECK(r.value()[2].liveStatus == LiveStatus::Live);
    CHECK(r.value()[3].liveStatus == LiveStatus::Completed);
    CHECK(isArchivable(r.value()[0].liveStatus));
    CHECK_FALSE(isArchivable(r.value()[1].liveStatus));
    CHECK_FALSE(isArchivable(r.value()[2].liveStatus));
    CHECK(isArchivable(r.value()[3].liveStatus));
}

TEST_CASE("httpStatusError: includes status and API message", "[api][errors]") {
    auto err = httpStatusError(
        HttpResponse{403, R"({"error": {"code": 403, "message": "quotaExceeded"}})"},
        "list channel");
    CHECK(err.code == ErrorCode::HttpError);
    CHECK_THAT(err.message, ContainsSubstring("list channel"));
    CHECK_THAT(err.message, ContainsSubstring("403"));
    CHECK_THAT(err.message, ContainsSubstring("quotaExceeded"));
}

TEST_CASE("urlEncode: escapes reserved characters", "[api]") {
    CHECK(urlEncode("@handle name") == "%40handle%20name");
    CHECK(urlEncode("a-b_c.d~e") == "a-b_c.d~e");
    CHECK(urlEncode("x,y") == "x%2Cy");
}

TEST_CASE("YouTubeDataApi: lookupChannel", "[api][client]") {
    ApiFixture f;

    SECTION("by handle uses forHandle and the API key") {
        f.http->push(200, kChannelBody);
        ChannelIdentity who;
        who.handle = "@some";
        auto r = f.yt->lookupChannel(who);
        REQUIRE(r);
        CHECK(r.value().uploadsFeedId == "UU123");
        REQUIRE(f.http->urls.size() == 1);
        CHECK_THAT(f.http->urls[0], ContainsSubstring("https://api.test/v3/channels?"));
        CHECK_THAT(f.http->urls[0], ContainsSubstring("forHandle=%40some"));
        CHECK_THAT(f.http->urls[0], ContainsSubstring("key=secret"));
    }

    SECTION("by username uses forUsername") {
        f.http->push(200, kChannelBody);
        ChannelIdentity who;
        who.username = "legacy";
        REQUIRE(f.yt->lookupChannel(who));
        CHECK_THAT(f.http->urls[0], ContainsSubstring("forUsername=legacy"));
    }

    SECTION("no items is NotFound") {
        f.http->push(200, R"({"items": []})");
        ChannelIdentity who;
        who.id = "UCmissing";
        auto r = f.yt->lookupChannel(who);
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::NotFound);
    }

    SECTION("several items is AmbiguousIdentity") {
        f.http->push(200, R"({"items": [
            {"id": "A", "contentDetails": {"relatedPlaylists": {"uploads": "UA"}}},
            {"id": "B", "contentDetails": {"relatedPlaylists": {"uploads": "UB"}}}
        ]})");
        ChannelIdentity who;
        who.username = "dup";
        auto r = f.yt->lookupChannel(who);
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::AmbiguousIdentity);
    }

    SECTION("identity with two identifiers never hits the network") {
        ChannelIdentity who;
        who.id = "UC1";
        who.handle = "@h";
        auto r = f.yt->lookupChannel(who);
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::AmbiguousIdentity);
        CHECK(f.http->urls.empty());
    }

    SECTION("HTTP error status becomes HttpError") {
        f.http->push(500, "");
        ChannelIdentity who;
        who.id = "UC1";
        auto r = f.yt->lookupChannel(who);
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::HttpError);
    }

    SECTION("transport failure keeps its code") {
        ChannelIdentity who;
        who.id = "UC1";
        auto r = f.yt->lookupChannel(who);
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::NetworkError);
        CHECK_THAT(r.error().message, ContainsSubstring("list channel"));
    }
}

TEST_CASE("YouTubeDataApi: listPlaylistItems passes page token", "[api][client]") {
    ApiFixture f;
    f.http->push(200, R"({"items": [{"contentDetails": {"videoId": "v9"}}]})");
    auto r = f.yt->listPlaylistItems("UU123", "NEXT", 50);
    REQUIRE(r);
    REQUIRE(r.value().items.size() == 1);
    CHECK(r.value().nextPageToken.empty());
    CHECK_THAT(f.http->urls[0], ContainsSubstring("playlistId=UU123"));
    CHECK_THAT(f.http->urls[0], ContainsSubstring("maxResults=50"));
    CHECK_THAT(f.http->urls[0], ContainsSubstring("pageToken=NEXT"));
}

TEST_CASE("YouTubeDataApi: listVideoStatus batches ids", "[api][client]") {
    ApiFixture f;

    SECTION("ids are joined into one request") {
        f.http->push(200, R"({"items": [{"id": "a", "snippet": {"liveBroadcastContent": "none"}}]})");
        auto r = f.yt->listVideoStatus({"a", "b"});
        REQUIRE(r);
        REQUIRE(f.http->urls.size() == 1);
        CHECK_THAT(f.http->urls[0], ContainsSubstring("id=a%2Cb"));
    }

    SECTION("empty batch makes no request") {
        auto r = f.yt->listVideoStatus({});
        REQUIRE(r);
        CHECK(r.value().empty());
        CHECK(f.http->urls.empty());
    }
}
