#include "device.hpp"

namespace emu {

const char* to_string(const Platform platform) {
    switch (platform) {
        case Platform::Android: return "Android";
        case Platform::Ios: return "iOS";
    }
    return "?";
}

const char* to_string(const DeviceStatus status) {
    switch (status) {
        case DeviceStatus::Stopped: return "Stopped";
        case DeviceStatus::Starting: return "Starting";
        case DeviceStatus::Running: return "Running";
        case DeviceStatus::Stopping: return "Stopping";
        case DeviceStatus::Error: return "Error";
        case DeviceStatus::Unknown: return "Unknown";
    }
    return "?";
}

} // namespace emu
