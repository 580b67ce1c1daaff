#pragma once

#include "app_state.hpp"
#include <chrono>
#include <string>

namespace emu {

struct AppConfig {
    std::string log_level = "info";
    std::string log_file;  // Empty: default cache location

    // Event loop
    std::chrono::milliseconds frame_interval{8};
    size_t max_events_per_frame = 50;
    std::chrono::milliseconds event_batch_budget{5};

    // Debounce delays
    std::chrono::milliseconds navigation_debounce{25};
    std::chrono::milliseconds detail_debounce{50};
    std::chrono::milliseconds log_debounce{100};

    // Refresh
    std::chrono::milliseconds auto_refresh_interval{3000};
    std::chrono::milliseconds pending_refresh_interval{1000};

    // State bounds
    std::chrono::milliseconds detail_cache_ttl{30000};
    std::chrono::milliseconds notification_ttl{5000};
    size_t max_log_entries = 1000;
    size_t max_notifications = 10;

    // Backends
    std::chrono::milliseconds command_timeout{30000};
    std::string android_sdk_root;

    [[nodiscard]] StateLimits state_limits() const;
};

// Reads the JSON configuration file. Missing keys keep their defaults.
class ConfigLoader {
public:
    explicit ConfigLoader(std::string config_path);

    // Missing file yields defaults; malformed content throws std::runtime_error
    [[nodiscard]] AppConfig load() const;

    // Parses a JSON document (used by load() and tests)
    [[nodiscard]] static AppConfig parse(const std::string& text, const std::string& origin = "<string>");

    // $XDG_CONFIG_HOME/emu/config.json or ~/.config/emu/config.json
    [[nodiscard]] static std::string default_path();

private:
    std::string path_;
};

} // namespace emu
