#pragma once

#include <ytarchive/api/types.h>
#include <ytarchive/api/youtube_api.h>
#include <ytarchive/core/types.h>

#include <functional>
#include <optional>
#include <string>
#include <unordered_set>

namespace ytarchive::archiver {

using VideoIdSet = std::unordered_set<std::string>;

/**
 * Per-channel state kept for the process lifetime. Metadata is requested once to preserve
 * quota.
 *
 * seen: nullopt means the full history is unknown and every page of the uploads feed must be
 * walked. Once engaged (even if empty) only the newest page is checked, and it is never reset
 * to nullopt again.
 */
struct CachedChannel {
    std::string id;
    std::string name;
    std::string uploadsFeedId;
    std::optional<VideoIdSet> seen;

    [[nodiscard]] bool hasSeen(const std::string& videoId) const {
        return seen && seen->count(videoId) > 0;
    }

    // Engages the seen set if needed and records videoId.
    void markSeen(const std::string& videoId);

    // Idempotent; no-op when the set is not engaged.
    void unmarkSeen(const std::string& videoId);
};

/**
 * Resolve a configured identity into a cache entry.
 * Fails with NotIdentified/AmbiguousIdentity/NotFound or the transport error, each prefixed
 * with "caching <identity>".
 */
Result<CachedChannel> resolveChannel(api::IYouTubeApi& api, const api::ChannelIdentity& identity);

using VisitFn = std::function<Result<void>(CachedChannel&, const api::VideoRecord&)>;

/**
 * Walk the channel's uploads feed in API order, skipping upcoming and live videos.
 *
 * When channel.seen is unset on entry every page is visited, otherwise only the first page.
 * Each page costs one extra videos.list call to batch-check broadcast status.
 * A visit error halts the walk immediately and is returned with channel/page context.
 * An empty first page fails with EmptyResults.
 */
Result<void> enumerateUploads(api::IYouTubeApi& api, CachedChannel& channel, const VisitFn& visit);

} // namespace ytarchive::archiver
