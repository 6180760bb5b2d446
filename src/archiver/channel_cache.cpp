#include <ytarchive/archiver/channel_cache.h>

#include <spdlog/spdlog.h>

#include <vector>

namespace ytarchive::archiver {

void CachedChannel::markSeen(const std::string& videoId) {
    if (!seen) {
        seen.emplace();
    }
    seen->insert(videoId);
}

void CachedChannel::unmarkSeen(const std::string& videoId) {
    if (seen) {
        seen->erase(videoId);
    }
}

Result<CachedChannel> resolveChannel(api::IYouTubeApi& api, const api::ChannelIdentity& identity) {
    const std::string context = "caching " + identity.key();
    if (auto valid = identity.validate(); !valid) {
        return wrapError(valid.error(), context);
    }

    auto info = api.lookupChannel(identity);
    if (!info) {
        return wrapError(info.error(), context);
    }

    CachedChannel ch;
    ch.id = info.value().id;
    ch.name = info.value().name;
    ch.uploadsFeedId = info.value().uploadsFeedId;
    spdlog::debug("Cached channel {} as {} ({}), uploads feed {}", identity.key(), ch.id, ch.name,
                  ch.uploadsFeedId);
    return ch;
}

namespace {

// Visit every archivable item of one page. Returns the visit error, if any.
Result<void> visitPage(api::IYouTubeApi& api, CachedChannel& channel,
                       const api::PlaylistPage& page, const VisitFn& visit) {
    std::vector<std::string> ids;
    ids.reserve(page.items.size());
    for (const auto& item : page.items) {
        ids.push_back(item.videoId);
    }

    auto statuses = api.listVideoStatus(ids);
    if (!statuses) {
        return statuses.error();
    }

    VideoIdSet pending;
    for (const auto& st : statuses.value()) {
        if (!api::isArchivable(st.liveStatus)) {
            pending.insert(st.id);
        }
    }

    for (const auto& item : page.items) {
        // Not marked seen, so the status is checked again next run.
        if (pending.count(item.videoId) > 0) {
            spdlog::debug("[{}] skipping {}: broadcast not finished", channel.id, item.videoId);
            continue;
        }
        if (auto r = visit(channel, item); !r) {
            return r;
        }
    }
    return {};
}

} // namespace

Result<void> enumerateUploads(api::IYouTubeApi& api, CachedChannel& channel, const VisitFn& visit) {
    const bool fullHistory = !channel.seen.has_value();
    const std::string context = "foreach video on " + channel.id;

    std::string token;
    int pageNo = 0;
    do {
        ++pageNo;
        const std::string pageContext = context + " (page " + std::to_string(pageNo) + ")";

        auto page = api.listPlaylistItems(channel.uploadsFeedId, token, api::kMaxPageSize);
        if (!page) {
            return wrapError(page.error(), pageContext);
        }
        if (page.value().items.empty()) {
            if (pageNo == 1) {
                return Error{ErrorCode::EmptyResults, pageContext + ": no results returned"};
            }
            break;
        }

        if (auto r = visitPage(api, channel, page.value(), visit); !r) {
            return wrapError(r.error(), pageContext);
        }
        token = page.value().nextPageToken;
    } while (fullHistory && !token.empty());

    spdlog::debug("[{}] enumerated {} page(s){}", channel.id, pageNo,
                  fullHistory ? " (full history)" : "");
    return {};
}

} // namespace ytarchive::archiver
