#include "platform_factory.hpp"
#include "android/android_device_manager.hpp"
#include "ios/ios_device_manager.hpp"
#include "posix/process_command_executor.hpp"
#include "stub/stub_device_manager.hpp"

namespace emu {

std::unique_ptr<ICommandExecutor> make_command_executor() {
    return std::make_unique<ProcessCommandExecutor>();
}

std::unique_ptr<IDeviceManager> make_android_manager(ICommandExecutor& executor, const AppConfig& config) {
    return std::make_unique<AndroidDeviceManager>(executor, config.android_sdk_root, config.command_timeout);
}

std::unique_ptr<IDeviceManager> make_ios_manager(ICommandExecutor& executor, const AppConfig& config) {
    return std::make_unique<IosDeviceManager>(executor, config.command_timeout);
}

std::unique_ptr<IDeviceManager> make_stub_manager(const Platform platform) {
    return std::make_unique<StubDeviceManager>(platform);
}

} // namespace emu
