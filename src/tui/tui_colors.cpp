#include "tui_colors.hpp"

namespace emu {

void init_colors() {
    if (!has_colors()) {
        return;
    }

    start_color();
    use_default_colors();

    // Basic colors
    init_pair(COLOR_PAIR_DEFAULT, -1, -1);  // Default terminal colors
    init_pair(COLOR_PAIR_TITLE, COLOR_CYAN, -1);
    init_pair(COLOR_PAIR_SELECTED, COLOR_BLACK, COLOR_CYAN);
    init_pair(COLOR_PAIR_SELECTED_INACTIVE, COLOR_BLACK, COLOR_WHITE);
    init_pair(COLOR_PAIR_HEADER, COLOR_YELLOW, -1);

    // Status
    init_pair(COLOR_PAIR_STATUS, COLOR_WHITE, COLOR_BLUE);
    init_pair(COLOR_PAIR_ERROR, COLOR_RED, -1);
    init_pair(COLOR_PAIR_WARNING, COLOR_YELLOW, -1);
    init_pair(COLOR_PAIR_SUCCESS, COLOR_GREEN, -1);
    init_pair(COLOR_PAIR_INFO, COLOR_CYAN, -1);

    // Device states
    init_pair(COLOR_PAIR_DEVICE_RUNNING, COLOR_GREEN, -1);
    init_pair(COLOR_PAIR_DEVICE_STOPPED, -1, -1);
    init_pair(COLOR_PAIR_DEVICE_TRANSITION, COLOR_YELLOW, -1);

    // Logs
    init_pair(COLOR_PAIR_LOG_DEBUG, COLOR_BLUE, -1);

    // Dialog
    init_pair(COLOR_PAIR_DIALOG, COLOR_WHITE, COLOR_BLUE);
    init_pair(COLOR_PAIR_DIALOG_BUTTON, COLOR_BLACK, COLOR_WHITE);
    init_pair(COLOR_PAIR_FIELD_ACTIVE, COLOR_BLACK, COLOR_CYAN);

    // Help
    init_pair(COLOR_PAIR_HELP_KEY, COLOR_CYAN, -1);
}

int get_status_color(const DeviceStatus status) {
    switch (status) {
        case DeviceStatus::Running:
            return COLOR_PAIR_DEVICE_RUNNING;
        case DeviceStatus::Starting:
        case DeviceStatus::Stopping:
            return COLOR_PAIR_DEVICE_TRANSITION;
        case DeviceStatus::Error:
            return COLOR_PAIR_ERROR;
        case DeviceStatus::Stopped:
        case DeviceStatus::Unknown:
            return COLOR_PAIR_DEVICE_STOPPED;
    }
    return COLOR_PAIR_DEFAULT;
}

int get_log_level_color(const LogLevel level) {
    switch (level) {
        case LogLevel::Error:
            return COLOR_PAIR_ERROR;
        case LogLevel::Warn:
            return COLOR_PAIR_WARNING;
        case LogLevel::Info:
            return COLOR_PAIR_DEFAULT;
        case LogLevel::Debug:
            return COLOR_PAIR_LOG_DEBUG;
    }
    return COLOR_PAIR_DEFAULT;
}

int get_notification_color(const NotificationLevel level) {
    switch (level) {
        case NotificationLevel::Success:
            return COLOR_PAIR_SUCCESS;
        case NotificationLevel::Error:
            return COLOR_PAIR_ERROR;
        case NotificationLevel::Warning:
            return COLOR_PAIR_WARNING;
        case NotificationLevel::Info:
            return COLOR_PAIR_INFO;
    }
    return COLOR_PAIR_DEFAULT;
}

} // namespace emu
