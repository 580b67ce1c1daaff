#pragma once

#include "../device.hpp"
#include "../viewmodels/log_panel_view_model.hpp"
#include "../viewmodels/notification_view_model.hpp"
#include <ncurses.h>

namespace emu {

// Color pair indices
enum ColorPair {
    COLOR_PAIR_DEFAULT = 1,
    COLOR_PAIR_TITLE,
    COLOR_PAIR_SELECTED,
    COLOR_PAIR_SELECTED_INACTIVE,
    COLOR_PAIR_HEADER,
    COLOR_PAIR_STATUS,
    COLOR_PAIR_ERROR,
    COLOR_PAIR_WARNING,
    COLOR_PAIR_SUCCESS,
    COLOR_PAIR_INFO,
    COLOR_PAIR_DEVICE_RUNNING,
    COLOR_PAIR_DEVICE_STOPPED,
    COLOR_PAIR_DEVICE_TRANSITION,
    COLOR_PAIR_LOG_DEBUG,
    COLOR_PAIR_DIALOG,
    COLOR_PAIR_DIALOG_BUTTON,
    COLOR_PAIR_FIELD_ACTIVE,
    COLOR_PAIR_HELP_KEY,
};

// Initialize ncurses color pairs
void init_colors();

int get_status_color(DeviceStatus status);
int get_log_level_color(LogLevel level);
int get_notification_color(NotificationLevel level);

} // namespace emu
