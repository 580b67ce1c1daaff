#include "logging.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <filesystem>

namespace emu::logging {

namespace {

constexpr size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr size_t kMaxLogFiles = 3;

} // namespace

std::string default_log_path() {
    if (const char* cache = std::getenv("XDG_CACHE_HOME"); cache && *cache) {
        return (std::filesystem::path(cache) / "emu" / "emu.log").string();
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return (std::filesystem::path(home) / ".cache" / "emu" / "emu.log").string();
    }
    return "emu.log";
}

void init(const LoggingConfig& config) {
    spdlog::drop("emu");
    std::shared_ptr<spdlog::logger> logger;

    if (config.sink == Sink::File) {
        const std::string path = config.file_path.empty() ? default_log_path() : config.file_path;

        std::error_code ec;
        std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);

        try {
            logger = spdlog::rotating_logger_mt("emu", path, kMaxLogFileSize, kMaxLogFiles);
        } catch (const spdlog::spdlog_ex&) {
            // Unwritable log location: keep the terminal clean and drop records
            logger = std::make_shared<spdlog::logger>("emu");
        }
    } else {
        logger = spdlog::stderr_color_mt("emu");
    }

    logger->set_level(spdlog::level::from_str(config.level));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
}

} // namespace emu::logging
