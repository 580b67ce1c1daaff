#pragma once

#include "device.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace emu::testing {

// Polls pred until it holds or the timeout elapses; returns the last result
inline bool wait_until(const std::function<bool()>& pred,
                       const std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return pred();
}

inline Device make_device(const Platform platform, const std::string& identifier,
                          const DeviceStatus status = DeviceStatus::Stopped) {
    Device device;
    device.platform = platform;
    device.identifier = identifier;
    device.name = identifier;
    device.status = status;
    if (platform == Platform::Android) {
        AndroidAttributes attrs;
        attrs.api_level = 34;
        attrs.android_version = "14";
        device.attributes = attrs;
    } else {
        IosAttributes attrs;
        attrs.runtime = "iOS 17.2";
        attrs.runtime_id = "com.apple.CoreSimulator.SimRuntime.iOS-17-2";
        device.attributes = attrs;
    }
    return device;
}

inline std::vector<Device> make_devices(const Platform platform, const std::vector<std::string>& identifiers) {
    std::vector<Device> devices;
    for (const auto& id : identifiers) {
        devices.push_back(make_device(platform, id));
    }
    return devices;
}

} // namespace emu::testing
