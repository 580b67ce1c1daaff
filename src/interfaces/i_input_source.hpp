#pragma once

#include "../input_event.hpp"
#include <chrono>
#include <optional>

namespace emu {

class IInputSource {
public:
    virtual ~IInputSource() = default;

    // Waits at most timeout for the next event
    virtual std::optional<KeyEvent> poll(std::chrono::milliseconds timeout) = 0;
};

} // namespace emu
