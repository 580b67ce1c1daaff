#pragma once

#include "config.hpp"
#include "interfaces/i_command_executor.hpp"
#include "interfaces/i_device_manager.hpp"
#include <memory>

namespace emu {

// Factory functions for the concrete backends.
// Managers keep a reference to the executor, which must outlive them.
std::unique_ptr<ICommandExecutor> make_command_executor();
std::unique_ptr<IDeviceManager> make_android_manager(ICommandExecutor& executor, const AppConfig& config);
std::unique_ptr<IDeviceManager> make_ios_manager(ICommandExecutor& executor, const AppConfig& config);

// In-memory family for --demo
std::unique_ptr<IDeviceManager> make_stub_manager(Platform platform);

} // namespace emu
