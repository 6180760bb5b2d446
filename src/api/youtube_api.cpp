/*
 * youtube_api.cpp
 *
 * YouTube Data API v3 client over IHttpTransport.
 * - channels.list     -> lookupChannel
 * - playlistItems.list -> listPlaylistItems
 * - videos.list       -> listVideoStatus (snippet.liveBroadcastContent)
 *
 * Every call costs quota, so callers batch where the API allows (50 IDs per videos.list).
 */

#include <ytarchive/api/youtube_api.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <string>
#include <utility>

namespace ytarchive::api {

using nlohmann::json;

namespace {

bool isHttpError(long status) {
    return status < 200 || status >= 300;
}

std::string stringField(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string())
        return {};
    return it->get<std::string>();
}

const json* objectField(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_object())
        return nullptr;
    return &(*it);
}

Result<json> parseBody(std::string_view body) {
    auto doc = json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Error{ErrorCode::InvalidData, "malformed JSON response"};
    }
    return doc;
}

const json& itemsOf(const json& doc) {
    static const json kEmpty = json::array();
    auto it = doc.find("items");
    if (it == doc.end() || !it->is_array())
        return kEmpty;
    return *it;
}

} // namespace

std::string urlEncode(std::string_view s) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

Error httpStatusError(const HttpResponse& response, std::string_view operation) {
    std::string message =
        std::string(operation) + ": http status " + std::to_string(response.status);
    auto doc = json::parse(response.body, nullptr, false);
    if (!doc.is_discarded() && doc.is_object()) {
        if (const auto* err = objectField(doc, "error")) {
            auto detail = stringField(*err, "message");
            if (!detail.empty()) {
                message += " (" + detail + ")";
            }
        }
    }
    return Error{ErrorCode::HttpError, std::move(message)};
}

Result<std::vector<ChannelInfo>> decodeChannelList(std::string_view body) {
    auto doc = parseBody(body);
    if (!doc)
        return doc.error();

    std::vector<ChannelInfo> out;
    for (const auto& item : itemsOf(doc.value())) {
        if (!item.is_object())
            continue;
        ChannelInfo info;
        info.id = stringField(item, "id");
        if (const auto* snippet = objectField(item, "snippet")) {
            info.name = stringField(*snippet, "title");
        }
        if (const auto* details = objectField(item, "contentDetails")) {
            if (const auto* related = objectField(*details, "relatedPlaylists")) {
                info.uploadsFeedId = stringField(*related, "uploads");
            }
        }
        if (info.id.empty() || info.uploadsFeedId.empty()) {
            return Error{ErrorCode::InvalidData, "channel item without id or uploads playlist"};
        }
        out.push_back(std::move(info));
    }
    return out;
}

Result<PlaylistPage> decodePlaylistItems(std::string_view body) {
    auto doc = parseBody(body);
    if (!doc)
        return doc.error();

    PlaylistPage page;
    page.nextPageToken = stringField(doc.value(), "nextPageToken");
    for (const auto& item : itemsOf(doc.value())) {
        if (!item.is_object())
            continue;
        VideoRecord rec;
        if (const auto* details = objectField(item, "contentDetails")) {
            rec.videoId = stringField(*details, "videoId");
        }
        if (const auto* snippet = objectField(item, "snippet")) {
            rec.title = stringField(*snippet, "title");
            rec.description = stringField(*snippet, "description");
            rec.channelId = stringField(*snippet, "videoOwnerChannelId");
            if (rec.channelId.empty()) {
                rec.channelId = stringField(*snippet, "channelId");
            }
            if (rec.videoId.empty()) {
                if (const auto* resource = objectField(*snippet, "resourceId")) {
                    rec.videoId = stringField(*resource, "videoId");
                }
            }
        }
        // Entries without a video ID (deleted/private placeholders) are dropped.
        if (rec.videoId.empty())
            continue;
        page.items.push_back(std::move(rec));
    }
    return page;
}

Result<std::vector<VideoStatus>> decodeVideoStatuses(std::string_view body) {
    auto doc = parseBody(body);
    if (!doc)
        return doc.error();

    std::vector<VideoStatus> out;
    for (const auto& item : itemsOf(doc.value())) {
        if (!item.is_object())
            continue;
        VideoStatus st;
        st.id = stringField(item, "id");
        if (st.id.empty())
            continue;
        if (const auto* snippet = objectField(item, "snippet")) {
            st.liveStatus = liveStatusFromString(stringField(*snippet, "liveBroadcastContent"));
        }
        out.push_back(std::move(st));
    }
    return out;
}

class YouTubeDataApi final : public IYouTubeApi {
public:
    YouTubeDataApi(YouTubeApiConfig cfg, std::shared_ptr<IHttpTransport> transport)
        : cfg_(std::move(cfg)), transport_(std::move(transport)) {}

    Result<ChannelInfo> lookupChannel(const ChannelIdentity& identity) override {
        if (auto valid = identity.validate(); !valid) {
            return valid.error();
        }

        std::string query = "part=id,snippet,contentDetails";
        switch (identity.kind()) {
            case ChannelIdentity::Kind::Id:
                query += "&id=" + urlEncode(identity.id);
                break;
            case ChannelIdentity::Kind::Handle:
                query += "&forHandle=" + urlEncode(identity.handle);
                break;
            case ChannelIdentity::Kind::Username:
                query += "&forUsername=" + urlEncode(identity.username);
                break;
            case ChannelIdentity::Kind::None:
                return Error{ErrorCode::NotIdentified};
        }

        auto body = request("channels", query, "list channel");
        if (!body)
            return body.error();
        auto channels = decodeChannelList(body.value());
        if (!channels)
            return wrapError(channels.error(), "list channel");
        if (channels.value().empty()) {
            return Error{ErrorCode::NotFound, "channel " + identity.key() + " not found"};
        }
        if (channels.value().size() > 1) {
            return Error{ErrorCode::AmbiguousIdentity,
                         "channel " + identity.key() + " matched " +
                             std::to_string(channels.value().size()) + " channels"};
        }
        return channels.value().front();
    }

    Result<PlaylistPage> listPlaylistItems(const std::string& playlistId,
                                           const std::string& pageToken,
                                           int maxResults) override {
        std::string query = "part=contentDetails,snippet&playlistId=" + urlEncode(playlistId) +
                            "&maxResults=" + std::to_string(maxResults);
        if (!pageToken.empty()) {
            query += "&pageToken=" + urlEncode(pageToken);
        }
        auto body = request("playlistItems", query, "list playlist items");
        if (!body)
            return body.error();
        auto page = decodePlaylistItems(body.value());
        if (!page)
            return wrapError(page.error(), "list playlist items");
        return page;
    }

    Result<std::vector<VideoStatus>>
    listVideoStatus(const std::vector<std::string>& ids) override {
        if (ids.empty())
            return std::vector<VideoStatus>{};

        std::string joined;
        for (const auto& id : ids) {
            if (!joined.empty())
                joined.push_back(',');
            joined += id;
        }
        auto body = request("videos", "part=snippet&id=" + urlEncode(joined), "check upcoming");
        if (!body)
            return body.error();
        auto statuses = decodeVideoStatuses(body.value());
        if (!statuses)
            return wrapError(statuses.error(), "check upcoming");
        return statuses;
    }

private:
    Result<std::string> request(const char* resource, const std::string& query,
                                std::string_view operation) {
        const std::string url = cfg_.baseUrl + "/" + resource + "?" + query;
        spdlog::debug("YouTube API GET {}?{}", cfg_.baseUrl + "/" + resource, query);

        auto resp = transport_->get(url + "&key=" + urlEncode(cfg_.apiKey));
        if (!resp)
            return wrapError(resp.error(), std::string(operation));
        if (isHttpError(resp.value().status))
            return httpStatusError(resp.value(), operation);
        return std::move(resp).value().body;
    }

    YouTubeApiConfig cfg_;
    std::shared_ptr<IHttpTransport> transport_;
};

std::unique_ptr<IYouTubeApi> makeYouTubeApi(const YouTubeApiConfig& cfg,
                                            std::shared_ptr<IHttpTransport> transport) {
    return std::make_unique<YouTubeDataApi>(cfg, std::move(transport));
}

} // namespace ytarchive::api
