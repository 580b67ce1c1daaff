#pragma once

#include "../device.hpp"
#include <chrono>
#include <deque>
#include <optional>
#include <string>

namespace emu {

enum class LogLevel {
    Error,
    Warn,
    Info,
    Debug
};

struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level = LogLevel::Info;
    DeviceTag source;
    std::string message;
};

struct LogPanelViewModel {
    // Ring buffer, oldest first
    std::deque<LogEntry> entries;

    // Device whose stream currently feeds the buffer
    std::optional<DeviceTag> stream_device;

    // Exact-level filter, none shows everything
    std::optional<LogLevel> filter;

    // Distance of the view from the newest filtered entry, 0 follows the tail
    size_t scroll_from_bottom = 0;
    bool auto_scroll = true;
};

const char* to_string(LogLevel level);

} // namespace emu
