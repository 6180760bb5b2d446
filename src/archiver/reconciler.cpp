#include <ytarchive/archiver/reconciler.h>

#include <spdlog/spdlog.h>

#include <array>
#include <system_error>

namespace ytarchive::archiver {

namespace fs = std::filesystem;

namespace {

constexpr std::array<std::string_view, 3> kLeftoverSuffixes = {".part", ".ytdl", ".temp"};

bool endsWith(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

} // namespace

std::optional<std::string> videoIdFromFilename(std::string_view filename) {
    if (endsWith(filename, kSidecarSuffix))
        return std::nullopt;
    for (auto suffix : kLeftoverSuffixes) {
        if (endsWith(filename, suffix))
            return std::nullopt;
    }
    auto id = filename.substr(0, filename.find('.'));
    if (id.empty())
        return std::nullopt;
    return std::string(id);
}

std::size_t reconcileChannel(const fs::path& root, CachedChannel& channel) {
    const fs::path dir = root / channel.id;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        // Not archived yet; full enumeration happens on the first run.
        spdlog::debug("[{}] no archive directory at {}", channel.id, dir.string());
        return 0;
    }

    std::size_t added = 0;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code typeEc;
        if (!it->is_regular_file(typeEc))
            continue;
        auto id = videoIdFromFilename(it->path().filename().string());
        if (!id)
            continue;
        if (!channel.hasSeen(*id)) {
            ++added;
        }
        channel.markSeen(*id);
    }
    if (ec) {
        spdlog::warn("[{}] error while scanning {}: {}", channel.id, dir.string(), ec.message());
    }

    spdlog::info("[{}] {} video(s) already archived on disk", channel.id, added);
    return added;
}

} // namespace ytarchive::archiver
