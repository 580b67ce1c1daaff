#include "tui_app.hpp"
#include "tui_colors.hpp"
#include <algorithm>

namespace emu {

void TuiApp::render_log_panel(WINDOW* win, const AppState& state) {
    if (!win) return;

    int max_y, max_x;
    getmaxyx(win, max_y, max_x);

    const auto& panel = state.log_panel();

    std::string title = "Logs";
    if (panel.stream_device) {
        const Device* device = state.find_device(*panel.stream_device);
        title += ": " + (device ? device->name : panel.stream_device->identifier);
    }
    if (panel.filter) {
        title += " [";
        title += to_string(*panel.filter);
        title += "]";
    }
    if (!panel.auto_scroll) {
        title += " (paused)";
    }
    draw_box_title(win, title);

    const auto entries = state.filtered_logs();
    if (entries.empty()) {
        wattron(win, A_DIM);
        mvwprintw(win, 1, 2, "%s", panel.stream_device ? "Waiting for log output..." : "Select a device to stream its logs");
        wattroff(win, A_DIM);
        return;
    }

    // Window of entries ending scroll_from_bottom lines above the tail
    const size_t visible = static_cast<size_t>(std::max(1, max_y - 2));
    const size_t offset = std::min(panel.scroll_from_bottom, entries.size() - 1);
    const size_t end = entries.size() - offset;
    const size_t begin = end > visible ? end - visible : 0;

    int row = 1;
    for (size_t i = begin; i < end && row < max_y - 1; ++i, ++row) {
        const LogEntry& entry = *entries[i];
        const std::string prefix = format_timestamp(entry.timestamp) + " " + to_string(entry.level)[0] + " ";

        wattron(win, A_DIM);
        mvwprintw(win, row, 2, "%s", prefix.c_str());
        wattroff(win, A_DIM);

        const int color = get_log_level_color(entry.level);
        wattron(win, COLOR_PAIR(color));
        mvwprintw(win, row, 2 + static_cast<int>(prefix.length()), "%s",
                  truncate(entry.message, max_x - 4 - static_cast<int>(prefix.length())).c_str());
        wattroff(win, COLOR_PAIR(color));
    }

    // Position indicator
    const std::string position = std::to_string(end) + "/" + std::to_string(entries.size());
    const int x = max_x - static_cast<int>(position.length()) - 4;
    if (x > 2) {
        mvwprintw(win, max_y - 1, x, " %s ", position.c_str());
    }
}

} // namespace emu
