#pragma once

#include "../interfaces/i_command_executor.hpp"
#include "../interfaces/i_device_manager.hpp"
#include "simctl_parser.hpp"
#include <chrono>

namespace emu {

// iOS simulators through `xcrun simctl`
class IosDeviceManager : public IDeviceManager {
public:
    IosDeviceManager(ICommandExecutor& executor, std::chrono::milliseconds command_timeout);

    [[nodiscard]] Platform platform() const override { return Platform::Ios; }
    bool is_available(const CancellationToken& token) override;

    std::vector<Device> list_devices(const CancellationToken& token) override;
    void start_device(const std::string& identifier, const CancellationToken& token) override;
    void stop_device(const std::string& identifier, const CancellationToken& token) override;
    void create_device(const DeviceConfig& config, const CancellationToken& token) override;
    void delete_device(const std::string& identifier, const CancellationToken& token) override;
    void wipe_device(const std::string& identifier, const CancellationToken& token) override;
    DeviceDetails get_device_details(const std::string& identifier, const CancellationToken& token) override;
    void stream_logs(const std::string& identifier,
                     const std::function<void(LogEntry)>& on_entry,
                     const CancellationToken& token) override;
    std::vector<DeviceTypeOption> list_device_types(const CancellationToken& token) override;
    std::vector<VersionOption> list_versions(const CancellationToken& token) override;

private:
    CommandResult simctl(std::vector<std::string> args, const CancellationToken& token);
    // Throws DeviceError(CommandFailed) on a non-zero exit
    std::string simctl_checked(std::vector<std::string> args, const CancellationToken& token);

    std::vector<ios::SimDevice> list_sims(const CancellationToken& token);
    ios::SimDevice find_sim(const std::string& udid, const CancellationToken& token);

    ICommandExecutor& executor_;
    std::chrono::milliseconds command_timeout_;
};

} // namespace emu
