#include <catch2/catch_test_macros.hpp>

#include <ytarchive/archiver/reconciler.h>

#include "support/temp_dir_scope.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace ytarchive::archiver;
using ytarchive::test_support::TempDirScope;
namespace fs = std::filesystem;

namespace {

void touch(const fs::path& p) {
    fs::create_directories(p.parent_path());
    std::ofstream(p) << "x";
}

} // namespace

TEST_CASE("videoIdFromFilename: prefix up to the first dot", "[archiver][reconcile]") {
    CHECK(videoIdFromFilename("abc123.mp4") == std::optional<std::string>("abc123"));
    CHECK(videoIdFromFilename("abc123.f137.webm") == std::optional<std::string>("abc123"));
    CHECK(videoIdFromFilename("noext") == std::optional<std::string>("noext"));

    CHECK_FALSE(videoIdFromFilename("abc123.info.json").has_value());
    CHECK_FALSE(videoIdFromFilename("channel.json").has_value());
    CHECK_FALSE(videoIdFromFilename("abc123.mp4.part").has_value());
    CHECK_FALSE(videoIdFromFilename("abc123.f137.mp4.ytdl").has_value());
    CHECK_FALSE(videoIdFromFilename(".hidden").has_value());
}

TEST_CASE("reconcileChannel: seeds seen from archived files", "[archiver][reconcile]") {
    auto tmp = TempDirScope::unique_under("ytarchive-reconcile");
    CachedChannel ch;
    ch.id = "UC1";

    SECTION("media plus sidecar yields one id") {
        touch(tmp.path() / "UC1" / "abc123.mp4");
        touch(tmp.path() / "UC1" / "abc123.info.json");
        CHECK(reconcileChannel(tmp.path(), ch) == 1);
        REQUIRE(ch.seen.has_value());
        CHECK(*ch.seen == VideoIdSet{"abc123"});
    }

    SECTION("partial downloads and subdirectories are ignored") {
        touch(tmp.path() / "UC1" / "keep.mkv");
        touch(tmp.path() / "UC1" / "partial.mp4.part");
        touch(tmp.path() / "UC1" / "channel.json");
        fs::create_directories(tmp.path() / "UC1" / "subdir.d");
        reconcileChannel(tmp.path(), ch);
        REQUIRE(ch.seen.has_value());
        CHECK(*ch.seen == VideoIdSet{"keep"});
    }

    SECTION("missing directory leaves seen unset") {
        CHECK(reconcileChannel(tmp.path(), ch) == 0);
        CHECK_FALSE(ch.seen.has_value());
    }

    SECTION("only sidecars leaves seen unset") {
        touch(tmp.path() / "UC1" / "channel.json");
        CHECK(reconcileChannel(tmp.path(), ch) == 0);
        CHECK_FALSE(ch.seen.has_value());
    }

    SECTION("existing entries are kept") {
        ch.markSeen("earlier");
        touch(tmp.path() / "UC1" / "abc123.mp4");
        reconcileChannel(tmp.path(), ch);
        CHECK(*ch.seen == VideoIdSet{"earlier", "abc123"});
    }
}
