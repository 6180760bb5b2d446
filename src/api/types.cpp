#include <ytarchive/api/types.h>

namespace ytarchive::api {

LiveStatus liveStatusFromString(std::string_view s) noexcept {
    if (s == "none")
        return LiveStatus::None;
    if (s == "upcoming")
        return LiveStatus::Upcoming;
    if (s == "live")
        return LiveStatus::Live;
    if (s == "completed")
        return LiveStatus::Completed;
    return LiveStatus::Unknown;
}

const char* toString(LiveStatus status) noexcept {
    switch (status) {
        case LiveStatus::None:
            return "none";
        case LiveStatus::Upcoming:
            return "upcoming";
        case LiveStatus::Live:
            return "live";
        case LiveStatus::Completed:
            return "completed";
        case LiveStatus::Unknown:
            break;
    }
    return "unknown";
}

ChannelIdentity::Kind ChannelIdentity::kind() const noexcept {
    if (!id.empty())
        return Kind::Id;
    if (!handle.empty())
        return Kind::Handle;
    if (!username.empty())
        return Kind::Username;
    return Kind::None;
}

std::size_t ChannelIdentity::specifiedCount() const noexcept {
    return static_cast<std::size_t>(!id.empty()) + static_cast<std::size_t>(!handle.empty()) +
           static_cast<std::size_t>(!username.empty());
}

std::string ChannelIdentity::key() const {
    switch (kind()) {
        case Kind::Id:
            return id;
        case Kind::Handle:
            return handle;
        case Kind::Username:
            return username;
        case Kind::None:
            break;
    }
    return "unknown";
}

Result<void> ChannelIdentity::validate() const {
    const auto n = specifiedCount();
    if (n == 0) {
        return Error{ErrorCode::NotIdentified, "channel has no id, handle or username"};
    }
    if (n > 1) {
        return Error{ErrorCode::AmbiguousIdentity,
                     "channel " + key() + " specifies more than one of id, handle, username"};
    }
    return {};
}

} // namespace ytarchive::api
