#pragma once

#include "app_state.hpp"
#include "input_event.hpp"
#include <optional>
#include <vector>

namespace emu {

// Side effects requested by the state machine, executed by the controller
enum class ActionType {
    Quit,
    Refresh,
    SelectionChanged,
    ToggleDevice,
    OpenCreateForm,
    SubmitCreate,
    DeleteDevice,
    WipeDevice
};

struct Action {
    ActionType type = ActionType::Refresh;
    std::optional<DeviceTag> device;
    std::optional<DeviceConfig> config;
};

// Pure translation of key events into AppState mutations plus requested actions.
// Modal: form, confirm and help modes capture every key.
class Navigator {
public:
    std::vector<Action> handle_key(AppState& state, const KeyEvent& event) const;

    // Batched list movement in browsing mode
    std::vector<Action> move_selection(AppState& state, int steps) const;

    // +1 / -1 when the event is a single-step list move in the current mode
    [[nodiscard]] std::optional<int> list_step(Mode mode, const KeyEvent& event) const;

    void set_page_size(size_t rows) { page_size_ = rows > 0 ? rows : 1; }
    [[nodiscard]] size_t page_size() const { return page_size_; }

private:
    std::vector<Action> handle_browsing_key(AppState& state, const KeyEvent& event) const;
    std::vector<Action> handle_form_key(AppState& state, const KeyEvent& event) const;
    std::vector<Action> handle_confirm_key(AppState& state, const KeyEvent& event) const;
    std::vector<Action> handle_fullscreen_log_key(AppState& state, const KeyEvent& event) const;
    std::vector<Action> handle_help_key(AppState& state, const KeyEvent& event) const;

    // Opens the yes/no dialog unless an operation is already pending for the device
    void request_confirmation(AppState& state, ConfirmAction action) const;
    static std::vector<Action> selection_changed(bool changed);

    size_t page_size_ = 10;
};

} // namespace emu
