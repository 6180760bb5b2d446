#include <ytarchive/api/youtube_api.h>
#include <ytarchive/app/scheduler.h>
#include <ytarchive/archiver/archiver.h>
#include <ytarchive/config/config.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <cstdio>
#include <exception>
#include <filesystem>
#include <memory>
#include <string>

namespace {

namespace fs = std::filesystem;
using namespace ytarchive;

constexpr int kExitPartialFailure = 2;

void setupLogging(const std::string& logFile, const std::string& level) {
    try {
        std::shared_ptr<spdlog::logger> logger;
        if (!logFile.empty()) {
            const size_t max_size = 10 * 1024 * 1024; // 10MB per file
            const size_t max_files = 5;
            auto sink =
                std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logFile, max_size, max_files);
            logger = std::make_shared<spdlog::logger>("ytarchive", sink);
        } else {
            logger = spdlog::stdout_color_mt("ytarchive");
        }
        spdlog::set_default_logger(logger);
        spdlog::flush_on(spdlog::level::info);
    } catch (const spdlog::spdlog_ex& e) {
        std::fprintf(stderr, "log setup failed, using default logger: %s\n", e.what());
    }

    if (level == "trace") {
        spdlog::set_level(spdlog::level::trace);
    } else if (level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (level == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (level == "error") {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

struct Loaded {
    std::unique_ptr<archiver::Archiver> archiver;
    std::chrono::seconds interval;
};

Result<Loaded> loadArchiver(const fs::path& configFile) {
    auto cfg = config::loadConfigFile(configFile);
    if (!cfg) {
        return cfg.error();
    }
    if (auto v = config::validateConfig(cfg.value()); !v) {
        return wrapError(v.error(), configFile.string());
    }
    spdlog::info("Loaded {} ({} channel(s), {} worker(s), every {}s)", configFile.string(),
                 cfg.value().archiver.channels.size(), cfg.value().archiver.maxParallel,
                 cfg.value().interval.count());

    std::shared_ptr<api::IHttpTransport> transport = api::makeCurlHttpTransport();
    std::shared_ptr<api::IYouTubeApi> youtube =
        api::makeYouTubeApi(api::YouTubeApiConfig{cfg.value().apiKey}, transport);

    auto ar = archiver::Archiver::create(cfg.value().archiver, std::move(youtube),
                                         archiver::makePosixProcessRunner());
    if (!ar) {
        return ar.error();
    }
    return Loaded{std::move(ar).value(), cfg.value().interval};
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"ytarchive - archive YouTube channels with yt-dlp"};

    std::string configPath;
    std::string logLevel = "info";
    std::string logFile;
    bool once = false;

    app.add_option("-c,--config", configPath, "Configuration file path");
    app.add_option("--log-level", logLevel, "Log level (trace/debug/info/warn/error)")
        ->default_val("info")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"}));
    app.add_option("--log-file", logFile, "Rotating log file path (default: stdout)");
    app.add_flag("--once", once, "Run a single archive cycle and exit");

    CLI11_PARSE(app, argc, argv);

    setupLogging(logFile, logLevel);

    auto configFile = config::findConfigFile(configPath);
    if (!configFile) {
        spdlog::critical("{}", configFile.error().message);
        return 1;
    }
    const fs::path resolved = configFile.value();

    try {
        auto loaded = loadArchiver(resolved);
        if (!loaded) {
            spdlog::critical("Startup failed: {}", loaded.error().message);
            return 1;
        }

        if (once) {
            auto err = loaded.value().archiver->archive();
            if (err) {
                spdlog::error("{}", err->describe());
                return kExitPartialFailure;
            }
            return 0;
        }

        app::Scheduler scheduler(std::move(loaded.value().archiver), loaded.value().interval,
                                 [resolved]() -> Result<std::unique_ptr<archiver::Archiver>> {
                                     auto next = loadArchiver(resolved);
                                     if (!next) {
                                         return next.error();
                                     }
                                     return std::move(next.value().archiver);
                                 });
        scheduler.run();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal: {}", e.what());
        return 1;
    }
    return 0;
}
