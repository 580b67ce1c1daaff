#pragma once

#include "../device.hpp"
#include <string>

namespace emu {

// Destructive actions that require a yes/no confirmation
enum class ConfirmAction {
    Delete,
    Wipe
};

struct ConfirmDialogViewModel {
    // Visibility
    bool is_visible = false;

    // Target device
    DeviceTag target;
    std::string target_name;

    ConfirmAction action = ConfirmAction::Delete;
};

} // namespace emu
