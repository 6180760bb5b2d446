#pragma once

#include <ytarchive/core/types.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace ytarchive::api {

/**
 * Broadcast state reported by the videos endpoint (snippet.liveBroadcastContent).
 * Only None and Completed are archivable.
 */
enum class LiveStatus { None, Upcoming, Live, Completed, Unknown };

LiveStatus liveStatusFromString(std::string_view s) noexcept;
const char* toString(LiveStatus status) noexcept;

inline bool isArchivable(LiveStatus status) noexcept {
    return status == LiveStatus::None || status == LiveStatus::Completed;
}

/**
 * One or more identifiers selecting a channel. Resolution uses the most specific one:
 * stable ID, then handle, then legacy username.
 */
struct ChannelIdentity {
    enum class Kind { Id, Handle, Username, None };

    std::string id;
    std::string handle;
    std::string username;

    [[nodiscard]] Kind kind() const noexcept;
    [[nodiscard]] std::size_t specifiedCount() const noexcept;

    // Highest-priority identifier present, or "unknown".
    [[nodiscard]] std::string key() const;

    // NotIdentified when nothing is set, AmbiguousIdentity when more than one field is.
    [[nodiscard]] Result<void> validate() const;

    bool operator==(const ChannelIdentity&) const = default;
};

struct ChannelInfo {
    std::string id;
    std::string name;
    std::string uploadsFeedId;
};

// A single entry of a playlist / uploads feed.
struct VideoRecord {
    std::string videoId;
    std::string channelId;
    std::string title;
    std::string description;
};

struct PlaylistPage {
    std::vector<VideoRecord> items;
    std::string nextPageToken; // empty on the last page
};

struct VideoStatus {
    std::string id;
    LiveStatus liveStatus{LiveStatus::Unknown};
};

} // namespace ytarchive::api
