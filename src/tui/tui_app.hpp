#pragma once

#include "../app_state.hpp"
#include "../interfaces/i_input_source.hpp"
#include "../interfaces/i_renderer.hpp"
#include <atomic>
#include <string>
#include <ncurses.h>

namespace emu {

// ncurses front end: keyboard input source and renderer of the shared state.
// All calls must come from the event loop thread.
class TuiApp : public IInputSource, public IRenderer {
public:
    TuiApp() = default;
    ~TuiApp() override;

    TuiApp(const TuiApp&) = delete;
    TuiApp& operator=(const TuiApp&) = delete;

    // Enters curses mode; shutdown() (or the destructor) restores the terminal
    void init();
    void shutdown();

    std::optional<KeyEvent> poll(std::chrono::milliseconds timeout) override;
    void render(const AppState& state) override;
    [[nodiscard]] size_t page_size() const override;

private:
    // Rendering
    void render_device_panel(WINDOW* win, const AppState& state, Platform platform, int& scroll_offset);
    void render_details_panel(const AppState& state);
    void render_log_panel(WINDOW* win, const AppState& state);
    void render_status_bar(const AppState& state);
    void render_notifications(const AppState& state);
    void render_confirm_dialog(const AppState& state);
    void render_create_form(const AppState& state);
    void render_help_overlay();

    // Input
    [[nodiscard]] static KeyEvent translate_key(int ch);

    // Window management
    void create_windows();
    void resize_windows();
    void cleanup_windows();

    // Utility
    void draw_box_title(WINDOW* win, const std::string& title);
    static std::string truncate(const std::string& text, int width);
    static std::string format_timestamp(std::chrono::system_clock::time_point time);
    static std::string format_age(std::chrono::steady_clock::duration age);

    bool initialized_ = false;
    bool resize_requested_ = false;

    // ncurses windows
    WINDOW* android_win_ = nullptr;
    WINDOW* ios_win_ = nullptr;
    WINDOW* details_win_ = nullptr;
    WINDOW* log_win_ = nullptr;
    WINDOW* fullscreen_log_win_ = nullptr;
    WINDOW* status_win_ = nullptr;

    // Scroll positions
    int android_scroll_offset_ = 0;
    int ios_scroll_offset_ = 0;
    int visible_device_rows_ = 10;

    // Layout constants
    static constexpr int kStatusBarHeight = 1;
    static constexpr int kDetailsHeight = 10;
    static constexpr int kMinLogHeight = 5;
    static constexpr double kDevicePanelRatio = 0.4;  // Share of the screen above the details panel
};

} // namespace emu
