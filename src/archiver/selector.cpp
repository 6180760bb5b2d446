#include <ytarchive/archiver/selector.h>

#include <spdlog/spdlog.h>

namespace ytarchive::archiver {

Result<std::unique_ptr<RegexSelector>> RegexSelector::create(RegexField field,
                                                             const std::string& pattern) {
    try {
        std::regex re(pattern, std::regex::ECMAScript);
        // Private constructor, so make_unique cannot reach it.
        return std::unique_ptr<RegexSelector>(new RegexSelector(field, std::move(re)));
    } catch (const std::regex_error& e) {
        return Error{ErrorCode::InvalidPattern,
                     "new selector regex: invalid pattern '" + pattern + "': " + e.what()};
    }
}

bool RegexSelector::shouldSelect(const api::VideoRecord& video) {
    const std::string& subject = field_ == RegexField::Title ? video.title : video.description;
    return std::regex_search(subject, re_);
}

PlaylistSelector::PlaylistSelector(std::string playlistId, std::shared_ptr<api::IYouTubeApi> api,
                                   std::chrono::milliseconds ttl, Clock clock)
    : playlistId_(std::move(playlistId)), api_(std::move(api)), ttl_(ttl),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::steady_clock::now(); })) {}

bool PlaylistSelector::needLoad() const {
    return !loadedAt_ || clock_() - *loadedAt_ > ttl_;
}

Result<void> PlaylistSelector::loadPlaylist() {
    std::unordered_set<std::string> members;
    std::string token;
    do {
        auto page = api_->listPlaylistItems(playlistId_, token, api::kMaxPageSize);
        if (!page) {
            return wrapError(page.error(), "load playlist " + playlistId_);
        }
        for (const auto& item : page.value().items) {
            members.insert(item.videoId);
        }
        token = page.value().nextPageToken;
    } while (!token.empty());

    members_.swap(members);
    loadedAt_ = clock_();
    spdlog::debug("Playlist {} loaded with {} member(s)", playlistId_, members_.size());
    return {};
}

bool PlaylistSelector::shouldSelect(const api::VideoRecord& video) {
    if (needLoad()) {
        if (auto r = loadPlaylist(); !r) {
            spdlog::warn("Playlist selector rejecting {}: {}", video.videoId, r.error().message);
            return false;
        }
    }
    return members_.count(video.videoId) > 0;
}

Result<std::unique_ptr<IVideoSelector>> makeSelector(const SelectorSpec& spec,
                                                     std::shared_ptr<api::IYouTubeApi> api) {
    if (!spec.regexPattern.empty()) {
        auto sel = RegexSelector::create(spec.regexField, spec.regexPattern);
        if (!sel) {
            return sel.error();
        }
        return std::unique_ptr<IVideoSelector>(std::move(sel).value());
    }
    if (!spec.playlistId.empty()) {
        return std::unique_ptr<IVideoSelector>(
            std::make_unique<PlaylistSelector>(spec.playlistId, std::move(api)));
    }
    if (!spec.videoIds.empty()) {
        return std::unique_ptr<IVideoSelector>(std::make_unique<IdSelector>(spec.videoIds));
    }
    return std::unique_ptr<IVideoSelector>{};
}

bool selectAll(const SelectorList& channelScoped, const SelectorList& global,
               const api::VideoRecord& video) {
    for (const auto& sel : channelScoped) {
        if (!sel->shouldSelect(video))
            return false;
    }
    for (const auto& sel : global) {
        if (!sel->shouldSelect(video))
            return false;
    }
    return true;
}

} // namespace ytarchive::archiver
