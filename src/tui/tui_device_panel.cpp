#include "tui_app.hpp"
#include "tui_colors.hpp"
#include <algorithm>

namespace emu {

namespace {

std::string version_label(const Device& device) {
    if (const auto* android = std::get_if<AndroidAttributes>(&device.attributes)) {
        if (android->api_level > 0) {
            return "API " + std::to_string(android->api_level);
        }
        return {};
    }
    return std::get<IosAttributes>(device.attributes).runtime;
}

const char* status_marker(const DeviceStatus status) {
    switch (status) {
        case DeviceStatus::Running:
            return "*";
        case DeviceStatus::Starting:
        case DeviceStatus::Stopping:
            return "~";
        case DeviceStatus::Error:
            return "!";
        case DeviceStatus::Stopped:
        case DeviceStatus::Unknown:
            return "-";
    }
    return " ";
}

} // namespace

void TuiApp::render_device_panel(WINDOW* win, const AppState& state, const Platform platform, int& scroll_offset) {
    if (!win) return;

    int max_y, max_x;
    getmaxyx(win, max_y, max_x);

    const bool focused = state.focus() == platform;
    const auto& devices = state.devices(platform);

    std::string title = platform == Platform::Android ? "Android Emulators" : "iOS Simulators";
    title += " (" + std::to_string(devices.size()) + ")";
    if (state.is_loading(platform)) {
        title += " ...";
    }
    draw_box_title(win, focused ? "[" + title + "]" : title);

    if (!state.is_backend_available(platform)) {
        wattron(win, COLOR_PAIR(COLOR_PAIR_WARNING));
        mvwprintw(win, 2, 2, "%s", truncate(platform == Platform::Android
                                                ? "Android SDK not found (set ANDROID_HOME)"
                                                : "Xcode command line tools not found",
                                            max_x - 4).c_str());
        wattroff(win, COLOR_PAIR(COLOR_PAIR_WARNING));
        return;
    }

    if (devices.empty()) {
        mvwprintw(win, 2, 2, "%s", state.is_loading(platform) ? "Loading..." : "No devices. Press 'c' to create one.");
        return;
    }

    // Column headers
    const int name_width = std::max(8, max_x - 30);
    wattron(win, COLOR_PAIR(COLOR_PAIR_HEADER) | A_BOLD);
    mvwprintw(win, 1, 2, "  %-*s %-10s %-12s", name_width, "Name", "Status", "Version");
    wattroff(win, COLOR_PAIR(COLOR_PAIR_HEADER) | A_BOLD);

    const int available_rows = std::max(1, max_y - 3);
    const int selected = static_cast<int>(state.selected_index(platform));

    // Keep the selection visible
    if (selected < scroll_offset) {
        scroll_offset = selected;
    } else if (selected >= scroll_offset + available_rows) {
        scroll_offset = selected - available_rows + 1;
    }
    scroll_offset = std::clamp(scroll_offset, 0, std::max(0, static_cast<int>(devices.size()) - available_rows));

    int row = 2;
    for (size_t i = static_cast<size_t>(scroll_offset); i < devices.size() && row < max_y - 1; ++i, ++row) {
        const Device& device = devices[i];
        const bool is_selected = static_cast<int>(i) == selected;
        const bool pending = state.is_operation_pending(device.tag());

        int attrs = 0;
        if (is_selected) {
            attrs = COLOR_PAIR(focused ? COLOR_PAIR_SELECTED : COLOR_PAIR_SELECTED_INACTIVE);
            wattron(win, attrs);
            mvwhline(win, row, 1, ' ', max_x - 2);
        } else {
            attrs = COLOR_PAIR(get_status_color(device.status));
            wattron(win, attrs);
        }

        std::string status = to_string(device.status);
        if (pending && device.status != DeviceStatus::Starting && device.status != DeviceStatus::Stopping) {
            status += "*";
        }

        mvwprintw(win, row, 2, "%s %-*s %-10s %-12s",
                  status_marker(device.status),
                  name_width, truncate(device.name, name_width).c_str(),
                  status.c_str(),
                  truncate(version_label(device), 12).c_str());

        wattroff(win, attrs);
    }

    // Scroll indicator
    if (static_cast<int>(devices.size()) > available_rows) {
        mvwprintw(win, max_y - 1, max_x - 12, " %zu/%zu ",
                  static_cast<size_t>(selected) + 1, devices.size());
    }
}

} // namespace emu
