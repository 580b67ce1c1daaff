#pragma once

#include "../interfaces/i_device_manager.hpp"
#include <chrono>
#include <mutex>
#include <vector>

namespace emu {

// In-memory device family with simulated latency.
// Backs --demo mode and exercises the full backend contract without SDKs.
class StubDeviceManager : public IDeviceManager {
public:
    explicit StubDeviceManager(Platform platform,
                               std::chrono::milliseconds latency = std::chrono::milliseconds(150));

    // Replaces the seeded fleet
    void set_devices(std::vector<Device> devices);

    [[nodiscard]] Platform platform() const override { return platform_; }
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
    void simulate_latency(const CancellationToken& token, int factor = 1) const;
    // Caller holds mutex_
    Device& find_locked(const std::string& identifier);

    Platform platform_;
    std::chrono::milliseconds latency_;

    std::mutex mutex_;
    std::vector<Device> devices_;
    int next_serial_ = 5554;
};

} // namespace emu
