#pragma once

#include <ytarchive/core/types.h>

#include <optional>
#include <string>
#include <vector>

namespace ytarchive::archiver {

/**
 * One failure inside a channel run. videoId is set for per-video download failures and empty
 * for channel-level failures (cache miss, enumeration halt).
 */
struct ArchiveFailure {
    std::optional<std::string> videoId;
    Error error;
};

struct ChannelError {
    std::string channel; // configured identity key
    std::vector<ArchiveFailure> failures;

    void add(Error e) { failures.push_back(ArchiveFailure{std::nullopt, std::move(e)}); }
    void addVideo(std::string videoId, Error e) {
        failures.push_back(ArchiveFailure{std::move(videoId), std::move(e)});
    }
    [[nodiscard]] bool empty() const noexcept { return failures.empty(); }

    std::string describe() const;
};

/**
 * Aggregate result of Archiver::archive(). A run never stops at the first failure; every
 * channel that had at least one failure contributes one ChannelError.
 */
struct ArchiveError {
    std::vector<ChannelError> channels;

    [[nodiscard]] bool empty() const noexcept { return channels.empty(); }
    [[nodiscard]] std::size_t failureCount() const noexcept;

    // Channel entry by identity key, or nullptr.
    const ChannelError* find(const std::string& channel) const;

    std::string describe() const;
};

} // namespace ytarchive::archiver
