#pragma once

#include <ytarchive/archiver/archiver_config.h>
#include <ytarchive/core/types.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace ytarchive::config {

inline constexpr const char* kConfigFileName = "ytarchive.json";
inline constexpr std::chrono::seconds kMinInterval{30};
inline constexpr const char* kPlaceholderApiKey = "YOUR_KEY_HERE";
inline constexpr std::size_t kMaxParallel = 64;

/**
 * Everything the daemon needs from ytarchive.json.
 */
struct AppConfig {
    archiver::ArchiverConfig archiver;
    std::string apiKey;
    std::chrono::seconds interval{0};
    // File the configuration was read from; empty when parsed from a string.
    std::filesystem::path source;
};

/**
 * Parse a duration such as "1h30m", "45m", "90s" or a plain number of seconds.
 */
Result<std::chrono::seconds> parseDuration(std::string_view text);

// Parses and applies defaults. Does not validate; see validateConfig().
Result<AppConfig> parseConfig(std::string_view jsonText);

Result<AppConfig> loadConfigFile(const std::filesystem::path& path);

/**
 * Rejects intervals below kMinInterval, blank or placeholder API keys, an empty channel
 * list, a worker count outside 1..kMaxParallel and channels with zero or several identifiers.
 */
Result<void> validateConfig(const AppConfig& cfg);

// Candidate locations in lookup order. An explicit path replaces the search.
std::vector<std::filesystem::path> configSearchPaths(const std::string& overridePath = "");

// First existing candidate, or NotFound listing what was tried.
Result<std::filesystem::path> findConfigFile(const std::string& overridePath = "");

} // namespace ytarchive::config
