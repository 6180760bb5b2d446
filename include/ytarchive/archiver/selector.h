#pragma once

#include <ytarchive/api/types.h>
#include <ytarchive/api/youtube_api.h>
#include <ytarchive/core/types.h>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <unordered_set>
#include <vector>

namespace ytarchive::archiver {

/**
 * A criterion a video must meet to be archived. Every configured selector must agree.
 * Selectors are evaluated on the orchestrator thread only.
 */
class IVideoSelector {
public:
    virtual ~IVideoSelector() = default;
    virtual bool shouldSelect(const api::VideoRecord& video) = 0;
};

using SelectorList = std::vector<std::unique_ptr<IVideoSelector>>;

enum class RegexField { Title, Description };

class RegexSelector final : public IVideoSelector {
public:
    // Fails with InvalidPattern when the expression does not compile.
    static Result<std::unique_ptr<RegexSelector>> create(RegexField field,
                                                         const std::string& pattern);

    bool shouldSelect(const api::VideoRecord& video) override;

    RegexField field() const noexcept { return field_; }

private:
    RegexSelector(RegexField field, std::regex re) : field_(field), re_(std::move(re)) {}

    RegexField field_;
    std::regex re_;
};

// Membership list older than this is fetched again.
inline constexpr std::chrono::hours kPlaylistStaleTimeout{24};

/**
 * Selects only members of a playlist. The membership list is loaded lazily through full
 * pagination and refreshed once it is older than the TTL. A failed load rejects the video
 * and leaves the list stale so the next evaluation retries.
 */
class PlaylistSelector final : public IVideoSelector {
public:
    using Clock = std::function<TimePoint()>;

    PlaylistSelector(std::string playlistId, std::shared_ptr<api::IYouTubeApi> api,
                     std::chrono::milliseconds ttl = kPlaylistStaleTimeout, Clock clock = {});

    bool shouldSelect(const api::VideoRecord& video) override;

    const std::string& playlistId() const noexcept { return playlistId_; }

private:
    bool needLoad() const;
    Result<void> loadPlaylist();

    std::string playlistId_;
    std::shared_ptr<api::IYouTubeApi> api_;
    std::chrono::milliseconds ttl_;
    Clock clock_;
    std::optional<TimePoint> loadedAt_;
    std::unordered_set<std::string> members_;
};

class IdSelector final : public IVideoSelector {
public:
    explicit IdSelector(const std::vector<std::string>& ids) : ids_(ids.begin(), ids.end()) {}

    bool shouldSelect(const api::VideoRecord& video) override {
        return ids_.count(video.videoId) > 0;
    }

private:
    std::unordered_set<std::string> ids_;
};

/**
 * Declarative selector description as found in the configuration file.
 * Exactly one of regexPattern / playlistId / videoIds is expected to be set; the first
 * non-empty one wins.
 */
struct SelectorSpec {
    RegexField regexField{RegexField::Title};
    std::string regexPattern;
    std::string playlistId;
    std::vector<std::string> videoIds;

    [[nodiscard]] bool empty() const noexcept {
        return regexPattern.empty() && playlistId.empty() && videoIds.empty();
    }
};

// Returns nullptr for an empty spec.
Result<std::unique_ptr<IVideoSelector>> makeSelector(const SelectorSpec& spec,
                                                     std::shared_ptr<api::IYouTubeApi> api);

// True when every selector in each list accepts the video; empty lists accept everything.
bool selectAll(const SelectorList& channelScoped, const SelectorList& global,
               const api::VideoRecord& video);

} // namespace ytarchive::archiver
