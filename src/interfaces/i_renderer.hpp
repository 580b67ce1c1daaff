#pragma once

#include "../app_state.hpp"

namespace emu {

class IRenderer {
public:
    virtual ~IRenderer() = default;

    // Called once per loop iteration with a read-only view of the state
    virtual void render(const AppState& state) = 0;

    // Rows moved by PageUp/PageDown in the device lists
    [[nodiscard]] virtual size_t page_size() const { return 10; }
};

} // namespace emu
