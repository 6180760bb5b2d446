#include <ytarchive/archiver/archiver.h>
#include <ytarchive/archiver/multiplexer.h>
#include <ytarchive/archiver/reconciler.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>
#include <system_error>

namespace ytarchive::archiver {

namespace fs = std::filesystem;

Archiver::Archiver(ArchiverConfig cfg, std::shared_ptr<api::IYouTubeApi> api,
                   std::shared_ptr<IProcessRunner> runner)
    : cfg_(std::move(cfg)), api_(std::move(api)), runner_(std::move(runner)) {
    if (cfg_.maxParallel == 0) {
        cfg_.maxParallel = defaultMaxParallel();
    }
}

Archiver::~Archiver() = default;

Result<std::unique_ptr<Archiver>> Archiver::create(ArchiverConfig cfg,
                                                   std::shared_ptr<api::IYouTubeApi> api,
                                                   std::shared_ptr<IProcessRunner> runner) {
    auto ar = std::make_unique<Archiver>(std::move(cfg), std::move(api), std::move(runner));

    if (auto r = ar->checkEnvironment(); !r) {
        return r.error();
    }
    if (auto r = ar->buildSelectors(); !r) {
        return r.error();
    }
    if (auto r = ar->buildChannelCache(); !r) {
        return r.error();
    }
    ar->reconcileDisk();
    if (ar->config().dumpChannelInfo) {
        if (auto r = ar->dumpChannelInfo(); !r) {
            return r.error();
        }
    }
    return std::move(ar);
}

Result<void> Archiver::checkEnvironment() {
    if (auto r = checkDownloader(*runner_, cfg_.download.downloader); !r) {
        return r.error();
    }

    std::error_code ec;
    fs::create_directories(cfg_.root, ec);
    if (ec) {
        return Error{ErrorCode::PermissionDenied,
                     "bad download directory " + cfg_.root.string() + ": " + ec.message()};
    }
    const fs::path marker = cfg_.root / kRootMarkerName;
    std::ofstream out(marker, std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::PermissionDenied,
                     "bad download directory: cannot write " + marker.string()};
    }
    return {};
}

Result<void> Archiver::buildSelectors() {
    globalSelectors_.clear();
    channelSelectors_.clear();

    auto build = [this](const std::vector<SelectorSpec>& specs, SelectorList& out) -> Result<void> {
        for (const auto& spec : specs) {
            auto sel = makeSelector(spec, api_);
            if (!sel) {
                return sel.error();
            }
            if (sel.value()) {
                out.push_back(std::move(sel).value());
            }
        }
        return {};
    };

    if (auto r = build(cfg_.selectors, globalSelectors_); !r) {
        return r;
    }
    channelSelectors_.resize(cfg_.channels.size());
    for (std::size_t i = 0; i < cfg_.channels.size(); ++i) {
        if (auto r = build(cfg_.channels[i].selectors, channelSelectors_[i]); !r) {
            return wrapError(r.error(), "channel " + cfg_.channels[i].identity.key());
        }
    }
    return {};
}

Result<void> Archiver::buildChannelCache() {
    for (const auto& ch : cfg_.channels) {
        auto cached = resolveChannel(*api_, ch.identity);
        if (!cached) {
            return wrapError(cached.error(), "build channel cache");
        }
        spdlog::info("Cached channel {} -> {} ({})", ch.identity.key(), cached.value().id,
                     cached.value().name);
        cache_[cacheKey(ch.identity)] = std::move(cached).value();
    }
    return {};
}

void Archiver::reconcileDisk() {
    for (const auto& ch : cfg_.channels) {
        if (auto* cached = cachedChannel(ch.identity)) {
            reconcileChannel(cfg_.root, *cached);
        }
    }
}

Result<void> Archiver::dumpChannelInfo() const {
    for (const auto& ch : cfg_.channels) {
        const auto* cached = cachedChannel(ch.identity);
        if (!cached)
            continue;

        const fs::path dir = cfg_.root / cached->id;
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            return Error{ErrorCode::WriteError, "create " + dir.string() + ": " + ec.message()};
        }

        nlohmann::json info = {
            {"id", cached->id},
            {"name", cached->name},
            {"uploads_playlist", cached->uploadsFeedId},
            {"identity", ch.identity.key()},
            {"updated_at", std::chrono::duration_cast<std::chrono::seconds>(
                               std::chrono::system_clock::now().time_since_epoch())
                               .count()},
        };
        std::ofstream out(dir / kChannelInfoFile, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::WriteError, "write " + (dir / kChannelInfoFile).string()};
        }
        out << info.dump(2);
    }
    return {};
}

std::optional<ArchiveError> Archiver::archive() {
    ArchiveError errors;
    const auto started = std::chrono::steady_clock::now();

    for (std::size_t i = 0; i < cfg_.channels.size(); ++i) {
        ChannelError cerr{cfg_.channels[i].identity.key(), {}};
        if (stop_.stop_requested()) {
            cerr.add(Error{ErrorCode::OperationCancelled, "archive run cancelled"});
        } else {
            archiveChannel(i, cerr);
        }
        if (!cerr.empty()) {
            errors.channels.push_back(std::move(cerr));
        }
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (errors.empty()) {
        spdlog::info("Archive run on {} channel(s) OK in {}ms", cfg_.channels.size(),
                     elapsed.count());
        return std::nullopt;
    }
    spdlog::warn("Archive run on {} channel(s) finished in {}ms with {} failure(s) on {} channel(s)",
                 cfg_.channels.size(), elapsed.count(), errors.failureCount(),
                 errors.channels.size());
    return errors;
}

void Archiver::archiveChannel(std::size_t index, ChannelError& cerr) {
    const auto& chCfg = cfg_.channels[index];
    auto* cached = cachedChannel(chCfg.identity);
    if (!cached) {
        cerr.add(Error{ErrorCode::CacheMiss, "ytarchiver archive: channel not in cache"});
        return;
    }
    CachedChannel& ch = *cached;
    spdlog::info("[{}] {}", ch.id, ch.name);

    // Cancellation scope for this channel's run, linked to the archiver-wide stop.
    std::stop_source runStop;
    std::stop_callback link(stop_.get_token(), [&runStop] { runStop.request_stop(); });

    auto runner = runner_;
    const auto download = cfg_.download;
    ArchiveMultiplexer mp(
        cfg_.maxParallel,
        [runner, download](const Job& job, std::stop_token st) {
            return downloadVideo(*runner, download, job.videoId, job.outputPath, st);
        },
        runStop.get_token());

    std::size_t submitted = 0;
    auto walked = enumerateUploads(
        *api_, ch, [&](CachedChannel& cc, const api::VideoRecord& video) -> Result<void> {
            if (runStop.stop_requested()) {
                return Error{ErrorCode::OperationCancelled, "archive run cancelled"};
            }
            // The first visit engages the seen set so later runs only check the newest page.
            if (!cc.seen) {
                cc.seen.emplace();
            }
            if (cc.hasSeen(video.videoId)) {
                return {};
            }
            if (!selectAll(channelSelectors_[index], globalSelectors_, video)) {
                spdlog::debug("[{}] {} not selected", cc.id, video.videoId);
                return {};
            }

            Job job{video.videoId, cc.id, outputTemplate(cfg_.root, cc.id, video.videoId)};
            if (!mp.submit(std::move(job))) {
                return Error{ErrorCode::OperationCancelled, "workers stopped"};
            }
            cc.markSeen(video.videoId);
            ++submitted;
            spdlog::debug("[{}] submitted {} ({})", cc.id, video.videoId, video.title);
            return {};
        });
    if (!walked) {
        spdlog::warn("[{}] enumeration halted: {}", ch.id, walked.error().message);
        cerr.add(walked.error());
    }

    mp.close();
    auto failures = mp.awaitCompletion();
    for (auto& f : failures) {
        // Eligible again next cycle.
        ch.unmarkSeen(f.videoId);
        cerr.addVideo(std::move(f.videoId), std::move(f.error));
    }

    spdlog::info("[{}] {} video(s) submitted, {} failed", ch.id, submitted, failures.size());
}

std::string Archiver::cacheKey(const api::ChannelIdentity& identity) {
    switch (identity.kind()) {
        case api::ChannelIdentity::Kind::Id:
            return "id:" + identity.id;
        case api::ChannelIdentity::Kind::Handle:
            return "handle:" + identity.handle;
        case api::ChannelIdentity::Kind::Username:
            return "user:" + identity.username;
        case api::ChannelIdentity::Kind::None:
            break;
    }
    return {};
}

CachedChannel* Archiver::cachedChannel(const api::ChannelIdentity& identity) {
    auto it = cache_.find(cacheKey(identity));
    return it == cache_.end() ? nullptr : &it->second;
}

const CachedChannel* Archiver::cachedChannel(const api::ChannelIdentity& identity) const {
    auto it = cache_.find(cacheKey(identity));
    return it == cache_.end() ? nullptr : &it->second;
}

} // namespace ytarchive::archiver
