#include "config.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace emu {

namespace {

std::chrono::milliseconds read_duration(const nlohmann::json& j, const char* key,
                                        const std::chrono::milliseconds fallback,
                                        const std::string& origin) {
    if (!j.contains(key)) return fallback;

    const auto value = j.at(key).get<long long>();
    if (value <= 0) {
        throw std::runtime_error(origin + ": '" + key + "' must be positive");
    }
    return std::chrono::milliseconds(value);
}

size_t read_bound(const nlohmann::json& j, const char* key, const size_t fallback,
                  const std::string& origin) {
    if (!j.contains(key)) return fallback;

    const auto value = j.at(key).get<long long>();
    if (value <= 0) {
        throw std::runtime_error(origin + ": '" + key + "' must be positive");
    }
    return static_cast<size_t>(value);
}

// Names spdlog::level::from_str understands; anything else would silently turn logging off
std::string read_log_level(const nlohmann::json& j, const std::string& fallback, const std::string& origin) {
    static const std::array<std::string_view, 7> kLevels{"trace", "debug", "info", "warn", "error", "critical", "off"};

    const std::string level = j.value("log_level", fallback);
    if (std::ranges::find(kLevels, std::string_view(level)) == kLevels.end()) {
        throw std::runtime_error(origin + ": 'log_level' must be one of trace, debug, info, warn, error, "
                                 "critical, off (got '" + level + "')");
    }
    return level;
}

} // namespace

StateLimits AppConfig::state_limits() const {
    StateLimits limits;
    limits.max_log_entries = max_log_entries;
    limits.max_notifications = max_notifications;
    limits.detail_cache_ttl = detail_cache_ttl;
    limits.notification_ttl = notification_ttl;
    return limits;
}

ConfigLoader::ConfigLoader(std::string config_path)
    : path_(std::move(config_path)) {}

std::string ConfigLoader::default_path() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return (std::filesystem::path(xdg) / "emu" / "config.json").string();
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return (std::filesystem::path(home) / ".config" / "emu" / "config.json").string();
    }
    return "config.json";
}

AppConfig ConfigLoader::load() const {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        spdlog::debug("[Config] {} not found, using defaults", path_);
        return AppConfig{};
    }

    std::ifstream in(path_);
    if (!in) {
        throw std::runtime_error("Cannot open config file: " + path_);
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse(buffer.str(), path_);
}

AppConfig ConfigLoader::parse(const std::string& text, const std::string& origin) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(origin + ": invalid JSON: " + e.what());
    }

    if (!j.is_object()) {
        throw std::runtime_error(origin + ": top-level value must be an object");
    }

    AppConfig config;
    try {
        config.log_level = read_log_level(j, config.log_level, origin);
        config.log_file = j.value("log_file", config.log_file);
        config.android_sdk_root = j.value("android_sdk_root", config.android_sdk_root);

        config.frame_interval = read_duration(j, "frame_interval_ms", config.frame_interval, origin);
        config.event_batch_budget = read_duration(j, "event_batch_budget_ms", config.event_batch_budget, origin);
        config.navigation_debounce = read_duration(j, "navigation_debounce_ms", config.navigation_debounce, origin);
        config.detail_debounce = read_duration(j, "detail_debounce_ms", config.detail_debounce, origin);
        config.log_debounce = read_duration(j, "log_debounce_ms", config.log_debounce, origin);
        config.auto_refresh_interval = read_duration(j, "auto_refresh_interval_ms",
                                                     config.auto_refresh_interval, origin);
        config.pending_refresh_interval = read_duration(j, "pending_refresh_interval_ms",
                                                        config.pending_refresh_interval, origin);
        config.detail_cache_ttl = read_duration(j, "detail_cache_ttl_ms", config.detail_cache_ttl, origin);
        config.notification_ttl = read_duration(j, "notification_ttl_ms", config.notification_ttl, origin);
        config.command_timeout = read_duration(j, "command_timeout_ms", config.command_timeout, origin);

        config.max_events_per_frame = read_bound(j, "max_events_per_frame", config.max_events_per_frame, origin);
        config.max_log_entries = read_bound(j, "max_log_entries", config.max_log_entries, origin);
        config.max_notifications = read_bound(j, "max_notifications", config.max_notifications, origin);
    } catch (const nlohmann::json::type_error& e) {
        throw std::runtime_error(origin + ": " + e.what());
    }

    return config;
}

} // namespace emu
