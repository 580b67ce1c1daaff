#include "tui_app.hpp"
#include "tui_colors.hpp"
#include <algorithm>
#include <sstream>

namespace emu {

void TuiApp::render_confirm_dialog(const AppState& state) {
    const auto& dialog = state.confirm_dialog();
    if (!dialog.is_visible) return;

    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);

    // Dialog dimensions
    const int dialog_width = std::min(56, max_x - 2);
    const int dialog_height = 9;
    const int dialog_x = (max_x - dialog_width) / 2;
    const int dialog_y = (max_y - dialog_height) / 2;

    // Create temporary window for dialog
    WINDOW* dialog_win = newwin(dialog_height, dialog_width, dialog_y, dialog_x);
    if (!dialog_win) return;

    wbkgd(dialog_win, COLOR_PAIR(COLOR_PAIR_DIALOG));
    box(dialog_win, 0, 0);

    const bool is_delete = dialog.action == ConfirmAction::Delete;
    const std::string title = is_delete ? " Delete Device " : " Wipe Device Data ";
    wattron(dialog_win, A_BOLD);
    mvwprintw(dialog_win, 0, (dialog_width - static_cast<int>(title.length())) / 2, "%s", title.c_str());
    wattroff(dialog_win, A_BOLD);

    mvwprintw(dialog_win, 2, 2, "%s", is_delete ? "Permanently delete:" : "Erase all user data of:");

    wattron(dialog_win, A_BOLD);
    mvwprintw(dialog_win, 3, 4, "%s", truncate(dialog.target_name, dialog_width - 6).c_str());
    wattroff(dialog_win, A_BOLD);

    wattron(dialog_win, COLOR_PAIR(COLOR_PAIR_WARNING) | A_BOLD);
    mvwprintw(dialog_win, 4, 2, "This cannot be undone.");
    wattroff(dialog_win, COLOR_PAIR(COLOR_PAIR_WARNING) | A_BOLD);

    // Buttons
    wattron(dialog_win, COLOR_PAIR(COLOR_PAIR_DIALOG_BUTTON));
    mvwprintw(dialog_win, 6, 6, " [Y] %s ", is_delete ? "Delete" : "Wipe");
    wattroff(dialog_win, COLOR_PAIR(COLOR_PAIR_DIALOG_BUTTON));
    mvwprintw(dialog_win, 6, 26, " [N] Cancel ");

    wrefresh(dialog_win);
    delwin(dialog_win);
}

void TuiApp::render_create_form(const AppState& state) {
    const auto& form = state.create_form();
    if (!form.is_visible) return;

    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);

    const int form_width = std::min(70, max_x - 2);
    const int form_height = std::min(max_y - 2, static_cast<int>(form.fields.size()) * 2 + 7);
    const int form_x = (max_x - form_width) / 2;
    const int form_y = (max_y - form_height) / 2;

    WINDOW* form_win = newwin(form_height, form_width, form_y, form_x);
    if (!form_win) return;

    wbkgd(form_win, COLOR_PAIR(COLOR_PAIR_DIALOG));
    box(form_win, 0, 0);

    const std::string title = form.platform == Platform::Android ? " Create Android Emulator " : " Create iOS Simulator ";
    wattron(form_win, A_BOLD);
    mvwprintw(form_win, 0, (form_width - static_cast<int>(title.length())) / 2, "%s", title.c_str());
    wattroff(form_win, A_BOLD);

    const int label_width = 14;
    const int value_width = form_width - label_width - 6;

    int row = 2;
    for (size_t i = 0; i < form.fields.size() && row < form_height - 3; ++i) {
        const FormField& field = form.fields[i];
        const bool active = i == form.active_field;

        if (active) wattron(form_win, A_BOLD);
        mvwprintw(form_win, row, 2, "%-*s", label_width, (field.label + ":").c_str());
        if (active) wattroff(form_win, A_BOLD);

        std::string value;
        if (field.kind == FormFieldKind::Choice) {
            if (field.has_choice()) {
                value = "< " + field.choice_labels[field.selected] + " >";
            } else {
                value = form.options_loading ? "Loading..." : "(none available)";
            }
        } else {
            value = field.value;
            if (active) value += "_";
        }

        const int attrs = active ? COLOR_PAIR(COLOR_PAIR_FIELD_ACTIVE) : A_UNDERLINE;
        wattron(form_win, attrs);
        mvwprintw(form_win, row, 2 + label_width, "%-*s", value_width, truncate(value, value_width).c_str());
        wattroff(form_win, attrs);

        if (!field.error.empty()) {
            wattron(form_win, COLOR_PAIR(COLOR_PAIR_ERROR) | A_BOLD);
            mvwprintw(form_win, row + 1, 2 + label_width, "%s", truncate(field.error, value_width).c_str());
            wattroff(form_win, COLOR_PAIR(COLOR_PAIR_ERROR) | A_BOLD);
        }
        row += 2;
    }

    // Form-level status line
    if (!form.error_message.empty()) {
        wattron(form_win, COLOR_PAIR(COLOR_PAIR_ERROR) | A_BOLD);
        mvwprintw(form_win, form_height - 3, 2, "%s", truncate(form.error_message, form_width - 4).c_str());
        wattroff(form_win, COLOR_PAIR(COLOR_PAIR_ERROR) | A_BOLD);
    } else if (form.is_submitting) {
        mvwprintw(form_win, form_height - 3, 2, "Creating device...");
    }

    wattron(form_win, COLOR_PAIR(COLOR_PAIR_DIALOG_BUTTON));
    mvwprintw(form_win, form_height - 2, 2, "%s",
              truncate(" Tab/Up/Down:Field  Left/Right:Choice  Enter:Create  Esc:Cancel ", form_width - 4).c_str());
    wattroff(form_win, COLOR_PAIR(COLOR_PAIR_DIALOG_BUTTON));

    wrefresh(form_win);
    delwin(form_win);
}

void TuiApp::render_help_overlay() {
    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);

    const int help_width = std::min(62, max_x - 2);
    const int help_height = std::min(31, max_y - 2);
    const int help_x = (max_x - help_width) / 2;
    const int help_y = (max_y - help_height) / 2;

    WINDOW* help_win = newwin(help_height, help_width, help_y, help_x);
    if (!help_win) return;

    wbkgd(help_win, COLOR_PAIR(COLOR_PAIR_DIALOG));
    box(help_win, 0, 0);

    wattron(help_win, A_BOLD);
    mvwprintw(help_win, 0, (help_width - 6) / 2, " Help ");
    wattroff(help_win, A_BOLD);

    const char* help_lines[] = {
        "Navigation:",
        "  Up/k, Down/j    Move selection up/down",
        "  PgUp, PgDn      Page up/down",
        "  Home/g, End/G   Jump to first/last",
        "  Tab, h/l        Switch Android/iOS panel",
        "",
        "Devices:",
        "  Enter/Space     Start or stop selected device",
        "  c               Create device",
        "  d               Delete device",
        "  w               Wipe device data",
        "  r/F5            Refresh device lists",
        "",
        "Logs:",
        "  f               Cycle level filter",
        "  F               Toggle fullscreen logs",
        "  L               Clear logs",
        "",
        "Other:",
        "  x               Dismiss notifications",
        "  ?/F1            This help",
        "  q               Quit",
    };

    int row = 2;
    for (const char* line : help_lines) {
        if (row >= help_height - 2) break;

        if (line[0] == ' ' && line[1] == ' ') {
            // Key binding line
            const std::string key(line, 2, 16);
            const std::string desc(line + 18);

            wattron(help_win, COLOR_PAIR(COLOR_PAIR_HELP_KEY));
            mvwprintw(help_win, row, 2, "%s", key.c_str());
            wattroff(help_win, COLOR_PAIR(COLOR_PAIR_HELP_KEY));
            mvwprintw(help_win, row, 18, "%s", truncate(desc, help_width - 20).c_str());
        } else {
            wattron(help_win, A_BOLD);
            mvwprintw(help_win, row, 2, "%s", line);
            wattroff(help_win, A_BOLD);
        }
        row++;
    }

    wattron(help_win, COLOR_PAIR(COLOR_PAIR_DIALOG_BUTTON));
    mvwprintw(help_win, help_height - 2, (help_width - 24) / 2, " Press Esc to close ");
    wattroff(help_win, COLOR_PAIR(COLOR_PAIR_DIALOG_BUTTON));

    wrefresh(help_win);
    delwin(help_win);
}

void TuiApp::render_status_bar(const AppState& state) {
    if (!status_win_) return;

    const int max_x = getmaxx(status_win_);

    wbkgd(status_win_, COLOR_PAIR(COLOR_PAIR_STATUS));
    werase(status_win_);

    // Left side: key hints for the current mode
    const char* hints = "";
    switch (state.mode()) {
        case Mode::Browsing:
            hints = "q:Quit  Enter:Start/Stop  c:Create  d:Delete  w:Wipe  r:Refresh  F:Logs  ?:Help";
            break;
        case Mode::CreateForm:
            hints = "Tab:Next field  Enter:Create  Esc:Cancel";
            break;
        case Mode::ConfirmPending:
            hints = "y:Confirm  n/Esc:Cancel";
            break;
        case Mode::FullscreenLog:
            hints = "j/k:Scroll  g/G:Top/Bottom  f:Filter  L:Clear  F/Esc:Back";
            break;
        case Mode::Help:
            hints = "Esc:Close help";
            break;
    }
    mvwprintw(status_win_, 0, 1, "%s", truncate(hints, max_x - 2).c_str());

    // Right side: pending operation or last refresh
    std::ostringstream right;
    if (const PendingOperation* op = state.latest_pending_operation()) {
        right << to_string(op->kind) << " " << op->device_name << "...";
    } else if (const auto last = state.last_refresh()) {
        right << "Updated " << format_age(AppState::Clock::now() - *last);
    }
    const std::string indicator = truncate(right.str(), 40);
    const int indicator_x = max_x - static_cast<int>(indicator.length()) - 2;
    if (!indicator.empty() && indicator_x > static_cast<int>(std::string(hints).length()) + 2) {
        mvwprintw(status_win_, 0, indicator_x, "%s", indicator.c_str());
    }
}

void TuiApp::render_notifications(const AppState& state) {
    const auto notifications = state.visible_notifications();
    if (notifications.empty()) return;

    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);

    // Newest at the top right, stacked downwards
    const int width = std::min(50, max_x - 2);
    const int shown = std::min(static_cast<int>(notifications.size()), std::max(1, (max_y - 2) / 3));
    const int height = shown + 2;

    WINDOW* win = newwin(height, width, 1, max_x - width - 1);
    if (!win) return;

    wbkgd(win, COLOR_PAIR(COLOR_PAIR_DEFAULT));
    box(win, 0, 0);

    int row = 1;
    for (auto it = notifications.rbegin(); it != notifications.rend() && row <= shown; ++it, ++row) {
        const int color = get_notification_color(it->level);
        wattron(win, COLOR_PAIR(color) | A_BOLD);
        mvwprintw(win, row, 1, " %s", truncate(it->message, width - 4).c_str());
        wattroff(win, COLOR_PAIR(color) | A_BOLD);
    }

    wrefresh(win);
    delwin(win);
}

} // namespace emu
