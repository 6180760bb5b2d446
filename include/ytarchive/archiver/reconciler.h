#pragma once

#include <ytarchive/archiver/channel_cache.h>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace ytarchive::archiver {

// Sidecar metadata (<id>.info.json, channel.json) never counts as an archived video.
inline constexpr std::string_view kSidecarSuffix = ".json";

/**
 * Derive the video ID from an archived filename: the prefix up to the first '.'.
 * Returns nullopt for sidecars, downloader leftovers (.part/.ytdl/.temp) and names with an
 * empty prefix.
 */
std::optional<std::string> videoIdFromFilename(std::string_view filename);

/**
 * Seed channel.seen from <root>/<channel.id>. The set is engaged on the first archived file
 * found; a missing directory leaves it untouched. Returns the number of IDs added.
 */
std::size_t reconcileChannel(const std::filesystem::path& root, CachedChannel& channel);

} // namespace ytarchive::archiver
