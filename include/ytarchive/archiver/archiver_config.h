#pragma once

#include <ytarchive/api/types.h>
#include <ytarchive/archiver/download.h>
#include <ytarchive/archiver/selector.h>

#include <cstddef>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

namespace ytarchive::archiver {

struct ChannelConfig {
    api::ChannelIdentity identity;
    // Applied in addition to the global selectors.
    std::vector<SelectorSpec> selectors;
};

inline std::size_t defaultMaxParallel() {
    auto n = std::thread::hardware_concurrency();
    return n == 0 ? 4 : n;
}

/**
 * Runtime configuration of the archiving engine.
 */
struct ArchiverConfig {
    // Archived files go to <root>/<channel id>/.
    std::filesystem::path root{"."};
    std::vector<ChannelConfig> channels;
    // Workers per channel run.
    std::size_t maxParallel{defaultMaxParallel()};
    DownloadOptions download;
    std::vector<SelectorSpec> selectors;
    // Write <root>/<channel id>/channel.json with the cached channel metadata.
    bool dumpChannelInfo{false};
};

} // namespace ytarchive::archiver
