#include "tui_app.hpp"
#include "tui_colors.hpp"
#include <algorithm>
#include <ctime>
#include <sstream>
#include <iomanip>

namespace emu {

TuiApp::~TuiApp() {
    shutdown();
}

void TuiApp::init() {
    if (initialized_) return;

    initscr();
    // Raw mode: Ctrl+C arrives as a key so shutdown goes through the event loop
    raw();
    noecho();
    keypad(stdscr, TRUE);
    curs_set(0);  // Hide cursor
    set_escdelay(25);  // Esc closes dialogs without a noticeable lag

    init_colors();

    // Set terminal title
    printf("\033]0;emu: emulators & simulators\007");
    fflush(stdout);

    create_windows();
    initialized_ = true;
}

void TuiApp::shutdown() {
    if (!initialized_) return;
    initialized_ = false;

    cleanup_windows();
    endwin();

    // Reset terminal title
    printf("\033]0;\007");
    fflush(stdout);
}

std::optional<KeyEvent> TuiApp::poll(const std::chrono::milliseconds timeout) {
    ::timeout(static_cast<int>(timeout.count()));
    const int ch = getch();
    if (ch == ERR) {
        return std::nullopt;
    }
    if (ch == KEY_RESIZE) {
        resize_requested_ = true;
    }
    return translate_key(ch);
}

size_t TuiApp::page_size() const {
    return static_cast<size_t>(std::max(1, visible_device_rows_));
}

void TuiApp::create_windows() {
    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);

    // Calculate panel heights
    const int available = std::max(1, max_y - kStatusBarHeight);
    int device_height = std::max(5, static_cast<int>(available * kDevicePanelRatio));
    int details_height = kDetailsHeight;
    int log_height = available - device_height - details_height;
    if (log_height < kMinLogHeight) {
        details_height = std::max(4, details_height - (kMinLogHeight - log_height));
        log_height = std::max(3, available - device_height - details_height);
    }

    // Create windows
    const int left_width = max_x / 2;
    android_win_ = newwin(device_height, left_width, 0, 0);
    ios_win_ = newwin(device_height, max_x - left_width, 0, left_width);
    visible_device_rows_ = device_height - 3;  // Account for border and header

    int y = device_height;
    details_win_ = newwin(details_height, max_x, y, 0);
    y += details_height;
    log_win_ = newwin(log_height, max_x, y, 0);

    fullscreen_log_win_ = newwin(available, max_x, 0, 0);
    status_win_ = newwin(kStatusBarHeight, max_x, available, 0);
}

void TuiApp::resize_windows() {
    cleanup_windows();
    create_windows();
}

void TuiApp::cleanup_windows() {
    for (WINDOW** win : {&android_win_, &ios_win_, &details_win_, &log_win_, &fullscreen_log_win_, &status_win_}) {
        if (*win) {
            delwin(*win);
            *win = nullptr;
        }
    }
}

void TuiApp::render(const AppState& state) {
    if (!initialized_) return;

    // Handle terminal resize
    if (resize_requested_) {
        resize_requested_ = false;
        endwin();
        refresh();
        resize_windows();
    }

    const bool fullscreen_log = state.mode() == Mode::FullscreenLog;

    if (fullscreen_log) {
        werase(fullscreen_log_win_);
        render_log_panel(fullscreen_log_win_, state);
        wnoutrefresh(fullscreen_log_win_);
    } else {
        werase(android_win_);
        werase(ios_win_);
        werase(details_win_);
        werase(log_win_);

        render_device_panel(android_win_, state, Platform::Android, android_scroll_offset_);
        render_device_panel(ios_win_, state, Platform::Ios, ios_scroll_offset_);
        render_details_panel(state);
        render_log_panel(log_win_, state);

        wnoutrefresh(android_win_);
        wnoutrefresh(ios_win_);
        wnoutrefresh(details_win_);
        wnoutrefresh(log_win_);
    }

    render_status_bar(state);
    wnoutrefresh(status_win_);
    doupdate();

    // Render overlays
    render_notifications(state);

    switch (state.mode()) {
        case Mode::ConfirmPending:
            render_confirm_dialog(state);
            break;
        case Mode::CreateForm:
            render_create_form(state);
            break;
        case Mode::Help:
            render_help_overlay();
            break;
        case Mode::Browsing:
        case Mode::FullscreenLog:
            break;
    }
}

void TuiApp::draw_box_title(WINDOW* win, const std::string& title) {
    box(win, 0, 0);
    if (!title.empty()) {
        wattron(win, COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);
        mvwprintw(win, 0, 2, " %s ", truncate(title, getmaxx(win) - 6).c_str());
        wattroff(win, COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);
    }
}

std::string TuiApp::truncate(const std::string& text, const int width) {
    if (width <= 0) return {};
    const auto max = static_cast<size_t>(width);
    if (text.length() <= max) return text;
    if (max <= 3) return text.substr(0, max);
    return text.substr(0, max - 3) + "...";
}

std::string TuiApp::format_timestamp(const std::chrono::system_clock::time_point time) {
    const std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm local{};
    localtime_r(&t, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S");
    return oss.str();
}

std::string TuiApp::format_age(const std::chrono::steady_clock::duration age) {
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(age).count();

    std::ostringstream oss;
    if (seconds < 60) {
        oss << seconds << "s ago";
    } else if (seconds < 3600) {
        oss << seconds / 60 << "m ago";
    } else {
        oss << seconds / 3600 << "h ago";
    }
    return oss.str();
}

} // namespace emu
