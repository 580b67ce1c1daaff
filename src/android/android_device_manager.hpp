#pragma once

#include "../interfaces/i_command_executor.hpp"
#include "../interfaces/i_device_manager.hpp"
#include "avd_parser.hpp"
#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>

namespace emu {

// Android Virtual Devices through avdmanager, emulator and adb
class AndroidDeviceManager : public IDeviceManager {
public:
    // sdk_root empty: ANDROID_HOME, then ANDROID_SDK_ROOT
    AndroidDeviceManager(ICommandExecutor& executor, std::string sdk_root,
                         std::chrono::milliseconds command_timeout);

    [[nodiscard]] Platform platform() const override { return Platform::Android; }
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
    struct Tools {
        std::filesystem::path sdk_root;
        std::filesystem::path avdmanager;
        std::filesystem::path emulator;
        std::filesystem::path adb;
    };

    [[nodiscard]] std::optional<Tools> locate_tools() const;
    // Throws DeviceError(ToolNotFound) when the SDK is missing
    [[nodiscard]] const Tools& tools();

    CommandResult run_tool(const std::filesystem::path& tool, std::vector<std::string> args,
                           const CancellationToken& token, const std::string& stdin_data = {});
    // Throws DeviceError(CommandFailed) on a non-zero exit
    std::string run_checked(const std::filesystem::path& tool, std::vector<std::string> args,
                            const CancellationToken& token, const std::string& stdin_data = {});

    // AVD name -> emulator serial
    std::map<std::string, std::string> running_emulators(const CancellationToken& token);
    std::vector<android::AvdEntry> list_avds(const CancellationToken& token);
    android::AvdEntry find_avd(const std::string& name, const CancellationToken& token);

    // Stops the emulator if running and waits for it to go away
    void ensure_stopped(const std::string& name, const CancellationToken& token);

    static std::map<std::string, std::string> read_config(const std::string& avd_path);
    static Device to_device(const android::AvdEntry& entry,
                            const std::map<std::string, std::string>& running);

    ICommandExecutor& executor_;
    std::string sdk_root_override_;
    std::chrono::milliseconds command_timeout_;

    std::mutex tools_mutex_;
    std::optional<Tools> tools_;
};

} // namespace emu
