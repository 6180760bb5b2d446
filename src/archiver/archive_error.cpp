#include <ytarchive/archiver/archive_error.h>

#include <spdlog/fmt/fmt.h>

#include <iterator>

namespace ytarchive::archiver {

std::string ChannelError::describe() const {
    fmt::memory_buffer out;
    fmt::format_to(std::back_inserter(out), "\tchannel {}: {} archiving errors:\n", channel,
                   failures.size());
    for (const auto& f : failures) {
        if (f.videoId) {
            fmt::format_to(std::back_inserter(out), "\t\t- archive video {}: {}\n", *f.videoId,
                           f.error.message);
        } else {
            fmt::format_to(std::back_inserter(out), "\t\t- {}: {}\n", f.error.code,
                           f.error.message);
        }
    }
    return fmt::to_string(out);
}

std::size_t ArchiveError::failureCount() const noexcept {
    std::size_t n = 0;
    for (const auto& ch : channels) {
        n += ch.failures.size();
    }
    return n;
}

const ChannelError* ArchiveError::find(const std::string& channel) const {
    for (const auto& ch : channels) {
        if (ch.channel == channel)
            return &ch;
    }
    return nullptr;
}

std::string ArchiveError::describe() const {
    std::string out = fmt::format("archiver: {} channel errors during archiving:\n", channels.size());
    for (const auto& ch : channels) {
        out += ch.describe();
    }
    return out;
}

} // namespace ytarchive::archiver
