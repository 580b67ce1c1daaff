#pragma once

#include <chrono>
#include <string>

namespace emu {

enum class NotificationLevel {
    Success,
    Error,
    Warning,
    Info
};

struct Notification {
    NotificationLevel level = NotificationLevel::Info;
    std::string message;
    std::chrono::steady_clock::time_point created_at;
    std::chrono::steady_clock::time_point expires_at;
};

} // namespace emu
