#pragma once

/*
 * ytarchive archiving engine
 *
 * Archiver owns one CachedChannel per configured channel for the process lifetime and runs
 * archive cycles over them:
 *
 *   enumerate uploads -> skip seen -> selectors -> submit to ArchiveMultiplexer -> mark seen
 *   await pool -> unmark failures -> collect ArchiveError
 *
 * Channels are processed one after another on the calling thread. Only the calling thread
 * touches the seen sets; workers only run downloads.
 */

#include <ytarchive/api/youtube_api.h>
#include <ytarchive/archiver/archive_error.h>
#include <ytarchive/archiver/archiver_config.h>
#include <ytarchive/archiver/channel_cache.h>
#include <ytarchive/archiver/download.h>
#include <ytarchive/archiver/selector.h>
#include <ytarchive/core/types.h>

#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace ytarchive::archiver {

// Marker written into the archive root by the writability check.
inline constexpr const char* kRootMarkerName = ".ytarchive";
inline constexpr const char* kChannelInfoFile = "channel.json";

class Archiver {
public:
    /**
     * The runner is shared by all workers and must be safe to call concurrently.
     * Construction performs no I/O; see create() for the startup sequence.
     */
    Archiver(ArchiverConfig cfg, std::shared_ptr<api::IYouTubeApi> api,
             std::shared_ptr<IProcessRunner> runner);
    ~Archiver();

    Archiver(const Archiver&) = delete;
    Archiver& operator=(const Archiver&) = delete;

    /**
     * Full startup: downloader and archive root checks, selector construction, channel cache,
     * disk reconciliation and optional channel.json dump. Any failure is fatal.
     */
    static Result<std::unique_ptr<Archiver>> create(ArchiverConfig cfg,
                                                    std::shared_ptr<api::IYouTubeApi> api,
                                                    std::shared_ptr<IProcessRunner> runner);

    Result<void> checkEnvironment();
    Result<void> buildSelectors();
    Result<void> buildChannelCache();
    void reconcileDisk();
    Result<void> dumpChannelInfo() const;

    /**
     * Run one archive cycle over every configured channel.
     * Returns nullopt when everything succeeded, otherwise the per-channel failures.
     */
    [[nodiscard]] std::optional<ArchiveError> archive();

    // Thread-safe. Cancels the running cycle between jobs and skips remaining channels.
    void requestStop() noexcept { stop_.request_stop(); }
    [[nodiscard]] bool stopRequested() const noexcept { return stop_.stop_requested(); }

    const ArchiverConfig& config() const noexcept { return cfg_; }

    CachedChannel* cachedChannel(const api::ChannelIdentity& identity);
    const CachedChannel* cachedChannel(const api::ChannelIdentity& identity) const;

private:
    static std::string cacheKey(const api::ChannelIdentity& identity);

    void archiveChannel(std::size_t index, ChannelError& cerr);

    ArchiverConfig cfg_;
    std::shared_ptr<api::IYouTubeApi> api_;
    std::shared_ptr<IProcessRunner> runner_;

    std::map<std::string, CachedChannel> cache_;
    std::vector<SelectorList> channelSelectors_; // parallel to cfg_.channels
    SelectorList globalSelectors_;

    std::stop_source stop_;
};

} // namespace ytarchive::archiver
