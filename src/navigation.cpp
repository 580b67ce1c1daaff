#include "navigation.hpp"
#include "create_device_form.hpp"

namespace emu {

std::vector<Action> Navigator::selection_changed(const bool changed) {
    if (!changed) return {};
    return {Action{ActionType::SelectionChanged, std::nullopt, std::nullopt}};
}

std::optional<int> Navigator::list_step(const Mode mode, const KeyEvent& event) const {
    if (mode != Mode::Browsing) return std::nullopt;
    if (event.key == Key::Up || event.is_char('k')) return -1;
    if (event.key == Key::Down || event.is_char('j')) return 1;
    return std::nullopt;
}

std::vector<Action> Navigator::move_selection(AppState& state, const int steps) const {
    if (state.mode() != Mode::Browsing || steps == 0) return {};
    return selection_changed(state.move_by(steps));
}

std::vector<Action> Navigator::handle_key(AppState& state, const KeyEvent& event) const {
    if (event.key == Key::Interrupt) {
        return {Action{ActionType::Quit, std::nullopt, std::nullopt}};
    }

    // Modal states take priority, in the same order they are drawn
    switch (state.mode()) {
        case Mode::Help:
            return handle_help_key(state, event);
        case Mode::ConfirmPending:
            return handle_confirm_key(state, event);
        case Mode::CreateForm:
            return handle_form_key(state, event);
        case Mode::FullscreenLog:
            return handle_fullscreen_log_key(state, event);
        case Mode::Browsing:
            break;
    }
    return handle_browsing_key(state, event);
}

std::vector<Action> Navigator::handle_browsing_key(AppState& state, const KeyEvent& event) const {
    const auto page = static_cast<int>(page_size_);

    switch (event.key) {
        case Key::Up:
            return selection_changed(state.select_previous());
        case Key::Down:
            return selection_changed(state.select_next());
        case Key::PageUp:
            return selection_changed(state.move_by(-page));
        case Key::PageDown:
            return selection_changed(state.move_by(page));
        case Key::Home:
            return selection_changed(state.select_first());
        case Key::End:
            return selection_changed(state.select_last());
        case Key::Tab:
        case Key::BackTab:
        case Key::Left:
        case Key::Right:
            // Two panels: forward and backward cycling coincide
            state.switch_focus();
            return {Action{ActionType::SelectionChanged, std::nullopt, std::nullopt}};
        case Key::Enter:
            if (const auto tag = state.selected_tag()) {
                return {Action{ActionType::ToggleDevice, tag, std::nullopt}};
            }
            return {};
        case Key::F1:
            state.set_mode(Mode::Help);
            return {};
        case Key::F5:
            return {Action{ActionType::Refresh, std::nullopt, std::nullopt}};
        case Key::Char:
            break;
        default:
            return {};
    }

    switch (event.ch) {
        case 'q':
        case 'Q':
            return {Action{ActionType::Quit, std::nullopt, std::nullopt}};
        case 'k':
            return selection_changed(state.select_previous());
        case 'j':
            return selection_changed(state.select_next());
        case 'g':
            return selection_changed(state.select_first());
        case 'G':
            return selection_changed(state.select_last());
        case 'h':
        case 'l':
            state.switch_focus();
            return {Action{ActionType::SelectionChanged, std::nullopt, std::nullopt}};
        case ' ':
            if (const auto tag = state.selected_tag()) {
                return {Action{ActionType::ToggleDevice, tag, std::nullopt}};
            }
            return {};
        case 'c':
            if (!state.is_backend_available(state.focus())) {
                state.push_notification(NotificationLevel::Warning,
                                        std::string(to_string(state.focus())) + " tools are not available");
                return {};
            }
            state.create_form() = make_create_form(state.focus());
            state.set_mode(Mode::CreateForm);
            return {Action{ActionType::OpenCreateForm, std::nullopt, std::nullopt}};
        case 'd':
            request_confirmation(state, ConfirmAction::Delete);
            return {};
        case 'w':
            request_confirmation(state, ConfirmAction::Wipe);
            return {};
        case 'r':
            return {Action{ActionType::Refresh, std::nullopt, std::nullopt}};
        case 'f':
            state.cycle_log_filter();
            return {};
        case 'F':
            state.set_mode(Mode::FullscreenLog);
            return {};
        case 'L':
            state.clear_logs();
            return {};
        case 'x':
            state.dismiss_all_notifications();
            return {};
        case '?':
            state.set_mode(Mode::Help);
            return {};
        default:
            return {};
    }
}

void Navigator::request_confirmation(AppState& state, const ConfirmAction action) const {
    const Device* device = state.selected_device();
    if (!device) return;

    if (state.is_operation_pending(device->tag())) {
        state.push_notification(NotificationLevel::Warning,
                                "Operation already in progress for " + device->name);
        return;
    }

    auto& dialog = state.confirm_dialog();
    dialog.is_visible = true;
    dialog.target = device->tag();
    dialog.target_name = device->name;
    dialog.action = action;
    state.set_mode(Mode::ConfirmPending);
}

std::vector<Action> Navigator::handle_confirm_key(AppState& state, const KeyEvent& event) const {
    auto& dialog = state.confirm_dialog();

    const bool confirm = event.key == Key::Enter || event.is_char('y') || event.is_char('Y');
    const bool cancel = event.key == Key::Escape || event.is_char('n') || event.is_char('N');
    if (!confirm && !cancel) {
        return {};
    }

    const DeviceTag target = dialog.target;
    const ConfirmAction action = dialog.action;
    dialog = ConfirmDialogViewModel{};
    state.set_mode(Mode::Browsing);

    if (cancel) return {};

    const ActionType type = action == ConfirmAction::Delete ? ActionType::DeleteDevice : ActionType::WipeDevice;
    return {Action{type, target, std::nullopt}};
}

std::vector<Action> Navigator::handle_form_key(AppState& state, const KeyEvent& event) const {
    auto& form = state.create_form();

    switch (event.key) {
        case Key::Escape:
            form = CreateFormViewModel{};
            state.set_mode(Mode::Browsing);
            return {};
        case Key::Up:
        case Key::BackTab:
            form_previous_field(form);
            return {};
        case Key::Down:
        case Key::Tab:
            form_next_field(form);
            return {};
        case Key::Left:
            form_cycle_choice(form, -1);
            return {};
        case Key::Right:
            form_cycle_choice(form, 1);
            return {};
        case Key::Backspace:
            form_backspace(form);
            return {};
        case Key::Enter:
            if (form.is_submitting || form.options_loading) {
                return {};
            }
            if (!validate_form(form)) {
                return {};
            }
            form.is_submitting = true;
            return {Action{ActionType::SubmitCreate, std::nullopt, form_to_config(form)}};
        case Key::Char:
            form_insert_char(form, event.ch);
            return {};
        default:
            return {};
    }
}

std::vector<Action> Navigator::handle_fullscreen_log_key(AppState& state, const KeyEvent& event) const {
    switch (event.key) {
        case Key::Up:
            state.scroll_logs_up(1);
            return {};
        case Key::Down:
            state.scroll_logs_down(1);
            return {};
        case Key::PageUp:
            state.scroll_logs_up(page_size_);
            return {};
        case Key::PageDown:
            state.scroll_logs_down(page_size_);
            return {};
        case Key::Home:
            state.scroll_logs_to_top();
            return {};
        case Key::End:
            state.scroll_logs_to_bottom();
            return {};
        case Key::Escape:
            state.set_mode(Mode::Browsing);
            return {};
        case Key::Char:
            break;
        default:
            return {};
    }

    switch (event.ch) {
        case 'q':
        case 'Q':
            return {Action{ActionType::Quit, std::nullopt, std::nullopt}};
        case 'k':
            state.scroll_logs_up(1);
            return {};
        case 'j':
            state.scroll_logs_down(1);
            return {};
        case 'g':
            state.scroll_logs_to_top();
            return {};
        case 'G':
            state.scroll_logs_to_bottom();
            return {};
        case 'f':
            state.cycle_log_filter();
            return {};
        case 'L':
            state.clear_logs();
            return {};
        case 'F':
            state.set_mode(Mode::Browsing);
            return {};
        default:
            return {};
    }
}

std::vector<Action> Navigator::handle_help_key(AppState& state, const KeyEvent& event) const {
    // Close help on specific keys only
    switch (event.key) {
        case Key::Escape:
        case Key::Enter:
        case Key::F1:
            state.set_mode(Mode::Browsing);
            return {};
        case Key::Char:
            if (event.ch == 'q' || event.ch == 'Q' || event.ch == ' ' || event.ch == '?') {
                state.set_mode(Mode::Browsing);
            }
            return {};
        default:
            return {};
    }
}

} // namespace emu
