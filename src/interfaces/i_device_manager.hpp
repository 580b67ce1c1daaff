#pragma once

#include "../cancellation.hpp"
#include "../device.hpp"
#include "../viewmodels/log_panel_view_model.hpp"
#include <functional>
#include <string>
#include <vector>

namespace emu {

// Capability set of one device family. Failures are reported as DeviceError,
// cancellation as TaskCancelled. Implementations return fresh copies and keep
// no references into application state.
class IDeviceManager {
public:
    virtual ~IDeviceManager() = default;

    [[nodiscard]] virtual Platform platform() const = 0;
    virtual bool is_available(const CancellationToken& token) = 0;

    virtual std::vector<Device> list_devices(const CancellationToken& token) = 0;
    virtual void start_device(const std::string& identifier, const CancellationToken& token) = 0;
    virtual void stop_device(const std::string& identifier, const CancellationToken& token) = 0;
    virtual void create_device(const DeviceConfig& config, const CancellationToken& token) = 0;
    virtual void delete_device(const std::string& identifier, const CancellationToken& token) = 0;
    virtual void wipe_device(const std::string& identifier, const CancellationToken& token) = 0;

    virtual DeviceDetails get_device_details(const std::string& identifier, const CancellationToken& token) = 0;

    // Blocks until the stream ends or the token is cancelled
    virtual void stream_logs(const std::string& identifier,
                             const std::function<void(LogEntry)>& on_entry,
                             const CancellationToken& token) = 0;

    // Creation form options
    virtual std::vector<DeviceTypeOption> list_device_types(const CancellationToken& token) = 0;
    virtual std::vector<VersionOption> list_versions(const CancellationToken& token) = 0;
};

} // namespace emu
