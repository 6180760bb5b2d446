#pragma once

/*
 * ytarchive remote metadata interfaces
 *
 * IYouTubeApi is the only view the archiving engine has of the remote catalog. The production
 * implementation talks to the YouTube Data API v3 through an IHttpTransport (libcurl); tests
 * substitute either layer.
 */

#include <ytarchive/api/types.h>
#include <ytarchive/core/types.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ytarchive::api {

// Maximum page size accepted by the list endpoints.
inline constexpr int kMaxPageSize = 50;

inline constexpr const char* kDefaultApiBaseUrl = "https://www.googleapis.com/youtube/v3";

struct HttpResponse {
    long status{0};
    std::string body;
};

struct HttpTransportConfig {
    std::chrono::milliseconds timeout{30000};
    bool insecure{false};
    std::string caPath; // empty = system default
    std::optional<std::string> proxy;
    std::string userAgent{"ytarchive"};
};

/**
 * Blocking HTTP GET. Transport-level failures are errors; any HTTP status (including 4xx/5xx)
 * is a successful transport result and is interpreted by the caller.
 */
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;
    virtual Result<HttpResponse> get(const std::string& url) = 0;
};

std::unique_ptr<IHttpTransport> makeCurlHttpTransport(const HttpTransportConfig& cfg = {});

class IYouTubeApi {
public:
    virtual ~IYouTubeApi() = default;

    /**
     * Resolve a channel identity to its stable metadata.
     * Fails with NotFound when the API returns no channel.
     */
    virtual Result<ChannelInfo> lookupChannel(const ChannelIdentity& identity) = 0;

    /**
     * Fetch one page of a playlist. An empty pageToken requests the first page.
     */
    virtual Result<PlaylistPage> listPlaylistItems(const std::string& playlistId,
                                                   const std::string& pageToken,
                                                   int maxResults = kMaxPageSize) = 0;

    /**
     * Batch broadcast-status lookup. IDs unknown to the API are absent from the result.
     */
    virtual Result<std::vector<VideoStatus>> listVideoStatus(const std::vector<std::string>& ids) = 0;
};

struct YouTubeApiConfig {
    std::string apiKey;
    std::string baseUrl{kDefaultApiBaseUrl};
};

std::unique_ptr<IYouTubeApi> makeYouTubeApi(const YouTubeApiConfig& cfg,
                                            std::shared_ptr<IHttpTransport> transport);

// Response decoders, exposed for testing.
Result<std::vector<ChannelInfo>> decodeChannelList(std::string_view body);
Result<PlaylistPage> decodePlaylistItems(std::string_view body);
Result<std::vector<VideoStatus>> decodeVideoStatuses(std::string_view body);

// Maps a non-2xx response to an HttpError carrying the API's error message when present.
Error httpStatusError(const HttpResponse& response, std::string_view operation);

std::string urlEncode(std::string_view s);

} // namespace ytarchive::api
