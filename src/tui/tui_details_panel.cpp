#include "tui_app.hpp"
#include "tui_colors.hpp"
#include <algorithm>
#include <utility>
#include <vector>

namespace emu {

void TuiApp::render_details_panel(const AppState& state) {
    if (!details_win_) return;

    int max_y, max_x;
    getmaxyx(details_win_, max_y, max_x);

    const Device* device = state.selected_device();
    draw_box_title(details_win_, device ? "Details: " + device->name : "Details");

    if (!device) {
        mvwprintw(details_win_, 1, 2, "No device selected");
        return;
    }

    // Cheap fields straight from the list entry
    std::vector<std::pair<std::string, std::string>> rows;
    rows.emplace_back("Status", to_string(device->status));
    if (device->status == DeviceStatus::Error && !device->status_message.empty()) {
        rows.emplace_back("Error", device->status_message);
    }

    const DeviceDetails* details = state.cached_detail();
    if (details) {
        const auto add = [&rows](const char* label, const std::string& value) {
            if (!value.empty()) rows.emplace_back(label, value);
        };
        add("Version", details->version);
        add("Device type", details->device_type);
        add("RAM", details->ram);
        add("Storage", details->storage);
        add("Resolution", details->resolution);
        add("Density", details->density);
        add("System image", details->system_image);
        add("Path", details->path);
        for (const auto& [label, value] : details->extra) {
            add(label.c_str(), value);
        }
    } else {
        rows.emplace_back("", "Loading details...");
    }

    // Two columns when the panel is too short for a single one
    const int inner_rows = std::max(1, max_y - 2);
    const int columns = static_cast<int>(rows.size()) > inner_rows && max_x > 80 ? 2 : 1;
    const int column_width = (max_x - 4) / columns;
    const int label_width = 14;

    for (size_t i = 0; i < rows.size(); ++i) {
        const int column = static_cast<int>(i) / inner_rows;
        if (column >= columns) break;
        const int row = 1 + static_cast<int>(i) % inner_rows;
        const int x = 2 + column * column_width;

        const auto& [label, value] = rows[i];
        if (!label.empty()) {
            wattron(details_win_, COLOR_PAIR(COLOR_PAIR_HEADER));
            mvwprintw(details_win_, row, x, "%-*s", label_width, truncate(label + ":", label_width).c_str());
            wattroff(details_win_, COLOR_PAIR(COLOR_PAIR_HEADER));
        }

        const int value_width = column_width - label_width - 1;
        if (label == "Status") {
            wattron(details_win_, COLOR_PAIR(get_status_color(device->status)) | A_BOLD);
            mvwprintw(details_win_, row, x + label_width, "%s", truncate(value, value_width).c_str());
            wattroff(details_win_, COLOR_PAIR(get_status_color(device->status)) | A_BOLD);
        } else {
            mvwprintw(details_win_, row, x + label_width, "%s", truncate(value, value_width).c_str());
        }
    }

    // Age of the cached entry
    if (details && state.cache_entry()) {
        const std::string age = "fetched " + format_age(AppState::Clock::now() - state.cache_entry()->fetched_at);
        const int x = max_x - static_cast<int>(age.length()) - 3;
        if (x > 2) {
            mvwprintw(details_win_, max_y - 1, x, " %s ", age.c_str());
        }
    }
}

} // namespace emu
