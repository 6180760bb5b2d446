#include <ytarchive/config/config.h>
#include <ytarchive/config/config_helpers.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <fstream>
#include <regex>
#include <sstream>

namespace ytarchive::config {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Largest duration whose steady_clock deadline cannot overflow.
constexpr std::int64_t kMaxDurationSeconds =
    std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::duration::max())
        .count() /
    2;

Error configError(const std::string& msg) {
    return Error{ErrorCode::InvalidArgument, "config: " + msg};
}

Error durationRangeError(const std::string& text) {
    return Error{ErrorCode::InvalidArgument, "duration '" + text + "' is out of range"};
}

// Adds digits * unitSeconds to total, failing instead of overflowing.
Result<void> accumulate(std::int64_t& total, const std::string& digits, std::int64_t unitSeconds,
                        const std::string& text) {
    std::uint64_t n = 0;
    const char* end = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(digits.data(), end, n);
    if (ec != std::errc{} || ptr != end) {
        return durationRangeError(text);
    }
    const auto limit = static_cast<std::uint64_t>(kMaxDurationSeconds);
    if (n > limit / static_cast<std::uint64_t>(unitSeconds)) {
        return durationRangeError(text);
    }
    const auto part = static_cast<std::int64_t>(n) * unitSeconds;
    if (part > kMaxDurationSeconds - total) {
        return durationRangeError(text);
    }
    total += part;
    return {};
}

Result<archiver::SelectorSpec> parseSelector(const json& j) {
    if (!j.is_object()) {
        return configError("selector must be an object");
    }

    archiver::SelectorSpec spec;
    if (auto it = j.find("regex"); it != j.end()) {
        if (!it->is_object()) {
            return configError("regex selector must be an object");
        }
        std::string type = it->value("type", std::string{"title"});
        std::transform(type.begin(), type.end(), type.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (type == "title") {
            spec.regexField = archiver::RegexField::Title;
        } else if (type == "description") {
            spec.regexField = archiver::RegexField::Description;
        } else {
            return configError("unknown regex selector type '" + type + "'");
        }
        spec.regexPattern = it->value("pattern", std::string{});
        if (spec.regexPattern.empty()) {
            return configError("regex selector without pattern");
        }
    }
    if (auto it = j.find("playlist"); it != j.end()) {
        spec.playlistId = it->get<std::string>();
    }
    if (auto it = j.find("videos"); it != j.end()) {
        spec.videoIds = it->get<std::vector<std::string>>();
    }
    return spec;
}

Result<std::vector<archiver::SelectorSpec>> parseSelectors(const json& parent) {
    std::vector<archiver::SelectorSpec> out;
    auto it = parent.find("selectors");
    if (it == parent.end() || it->is_null()) {
        return out;
    }
    if (!it->is_array()) {
        return configError("'selectors' must be an array");
    }
    for (const auto& entry : *it) {
        auto spec = parseSelector(entry);
        if (!spec) {
            return spec.error();
        }
        if (spec.value().empty()) {
            spdlog::warn("config: ignoring selector without regex, playlist or videos");
            continue;
        }
        out.push_back(std::move(spec).value());
    }
    return out;
}

Result<archiver::ChannelConfig> parseChannel(const json& j) {
    if (!j.is_object()) {
        return configError("channel entry must be an object");
    }
    archiver::ChannelConfig ch;
    ch.identity.id = j.value("id", std::string{});
    ch.identity.handle = j.value("handle", std::string{});
    ch.identity.username = j.value("username", std::string{});

    auto sel = parseSelectors(j);
    if (!sel) {
        return wrapError(sel.error(), "channel " + ch.identity.key());
    }
    ch.selectors = std::move(sel).value();
    return ch;
}

Result<std::chrono::seconds> parseInterval(const json& j) {
    if (j.is_number_integer()) {
        auto n = j.get<long long>();
        if (n < 0) {
            return configError("'interval' must not be negative");
        }
        if (n > kMaxDurationSeconds) {
            return configError("'interval' is out of range");
        }
        return std::chrono::seconds(n);
    }
    if (j.is_string()) {
        auto d = parseDuration(j.get<std::string>());
        if (!d) {
            return wrapError(d.error(), "config: 'interval'");
        }
        return d.value();
    }
    return configError("'interval' must be a duration string or a number of seconds");
}

Result<AppConfig> fromJson(const json& doc) {
    if (!doc.is_object()) {
        return configError("top level must be an object");
    }

    AppConfig cfg;
    auto& ar = cfg.archiver;

    auto root = doc.find("root");
    if (root == doc.end() || !root->is_string()) {
        return configError("'root' is required");
    }
    ar.root = expand_tilde(root->get<std::string>());

    cfg.apiKey = doc.value("api_key", std::string{});

    auto interval = doc.find("interval");
    if (interval == doc.end()) {
        return configError("'interval' is required");
    }
    auto iv = parseInterval(*interval);
    if (!iv) {
        return iv.error();
    }
    cfg.interval = iv.value();

    ar.maxParallel = std::min(archiver::defaultMaxParallel(), kMaxParallel);
    if (auto it = doc.find("max_parallel"); it != doc.end()) {
        const auto n = it->get<std::int64_t>();
        if (n < 0) {
            return configError("'max_parallel' must not be negative");
        }
        if (n > 0) {
            ar.maxParallel = static_cast<std::size_t>(n);
        }
    }

    ar.download.downloader =
        expand_tilde(doc.value("downloader", ar.download.downloader.string()));
    ar.download.maxRetries = doc.value("max_retries", ar.download.maxRetries);
    if (ar.download.maxRetries < archiver::kRetryForever) {
        return configError("'max_retries' must be -1 (forever) or at least 0");
    }
    if (auto it = doc.find("retry_backoff_ms"); it != doc.end()) {
        ar.download.initialBackoff = std::chrono::milliseconds(it->get<std::uint64_t>());
    }
    ar.download.mergeOutputFormat =
        doc.value("merge_output_format", ar.download.mergeOutputFormat);
    ar.download.writeInfoJson = doc.value("dump_video_info", false);
    ar.dumpChannelInfo = doc.value("dump_channel_info", false);

    auto channels = doc.find("channels");
    if (channels != doc.end() && !channels->is_array()) {
        return configError("'channels' must be an array");
    }
    if (channels != doc.end()) {
        for (const auto& entry : *channels) {
            auto ch = parseChannel(entry);
            if (!ch) {
                return ch.error();
            }
            ar.channels.push_back(std::move(ch).value());
        }
    }

    auto global = parseSelectors(doc);
    if (!global) {
        return global.error();
    }
    ar.selectors = std::move(global).value();
    return cfg;
}

} // namespace

Result<std::chrono::seconds> parseDuration(std::string_view text) {
    std::string s = trimmed(std::string(text));
    if (s.empty()) {
        return Error{ErrorCode::InvalidArgument, "empty duration"};
    }

    std::int64_t total = 0;
    static const std::regex secondsOnly(R"(^\d+$)");
    if (std::regex_match(s, secondsOnly)) {
        if (auto r = accumulate(total, s, 1, s); !r) {
            return r.error();
        }
        return std::chrono::seconds(total);
    }

    static const std::regex composite(R"(^(?:(\d+)h)?(?:(\d+)m)?(?:(\d+)s)?$)",
                                      std::regex_constants::icase);
    std::smatch match;
    if (!std::regex_match(s, match, composite)) {
        return Error{ErrorCode::InvalidArgument, "invalid duration '" + s + "'"};
    }

    constexpr std::int64_t units[] = {3600, 60, 1};
    for (std::size_t i = 0; i < 3; ++i) {
        if (!match[i + 1].matched)
            continue;
        if (auto r = accumulate(total, match[i + 1].str(), units[i], s); !r) {
            return r.error();
        }
    }
    return std::chrono::seconds(total);
}

Result<AppConfig> parseConfig(std::string_view jsonText) {
    try {
        auto doc = json::parse(jsonText.begin(), jsonText.end());
        return fromJson(doc);
    } catch (const json::exception& e) {
        return configError(e.what());
    }
}

Result<AppConfig> loadConfigFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::NotFound, "config: cannot open " + path.string()};
    }
    std::ostringstream ss;
    ss << in.rdbuf();

    auto cfg = parseConfig(ss.str());
    if (!cfg) {
        return wrapError(cfg.error(), path.string());
    }
    cfg.value().source = path;
    return cfg;
}

Result<void> validateConfig(const AppConfig& cfg) {
    const auto key = trimmed(cfg.apiKey);
    if (key.empty() || key == kPlaceholderApiKey) {
        return configError("'api_key' is not set");
    }
    if (cfg.interval < kMinInterval) {
        return configError("'interval' must be at least " + std::to_string(kMinInterval.count()) +
                           "s, got " + std::to_string(cfg.interval.count()) + "s");
    }
    if (cfg.archiver.maxParallel == 0 || cfg.archiver.maxParallel > kMaxParallel) {
        return configError("'max_parallel' must be between 1 and " +
                           std::to_string(kMaxParallel) + ", got " +
                           std::to_string(cfg.archiver.maxParallel));
    }
    if (cfg.archiver.root.empty()) {
        return configError("'root' is empty");
    }
    if (cfg.archiver.channels.empty()) {
        return configError("no channels configured");
    }
    for (std::size_t i = 0; i < cfg.archiver.channels.size(); ++i) {
        const auto& identity = cfg.archiver.channels[i].identity;
        if (auto r = identity.validate(); !r) {
            return wrapError(r.error(),
                             "config: channel #" + std::to_string(i) + " (" + identity.key() + ")");
        }
    }
    return {};
}

std::vector<fs::path> configSearchPaths(const std::string& overridePath) {
    if (!overridePath.empty()) {
        return {expand_tilde(overridePath)};
    }
    return {
        fs::path(kConfigFileName),
        get_config_dir() / kConfigFileName,
        fs::path("/etc") / kConfigFileName,
        fs::path("/usr/share/ytarchive") / kConfigFileName,
    };
}

Result<fs::path> findConfigFile(const std::string& overridePath) {
    std::string tried;
    for (const auto& candidate : configSearchPaths(overridePath)) {
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec)) {
            return candidate;
        }
        if (!tried.empty())
            tried += ", ";
        tried += candidate.string();
    }
    return Error{ErrorCode::NotFound, "no configuration file found (tried " + tried + ")"};
}

} // namespace ytarchive::config
