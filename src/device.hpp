#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace emu {

// The two device families
enum class Platform {
    Android,
    Ios
};

enum class DeviceStatus {
    Stopped,
    Starting,
    Running,
    Stopping,
    Error,
    Unknown
};

// Identity of a device across the application: family + backend identifier
// (AVD name for Android, UDID for iOS)
struct DeviceTag {
    Platform platform = Platform::Android;
    std::string identifier;

    bool operator==(const DeviceTag&) const = default;
    auto operator<=>(const DeviceTag&) const = default;
};

struct AndroidAttributes {
    int api_level = 0;
    std::string android_version;    // "14"
    std::string device_profile;     // "pixel_7"
    std::string abi;                // "x86_64"
    std::string target;             // Full "Based on:" target line
    std::string path;               // AVD directory
    std::string serial;             // emulator-5554 while running
    int ram_mb = 0;
    int storage_mb = 0;
};

struct IosAttributes {
    std::string runtime;            // "iOS 17.2"
    std::string runtime_id;         // com.apple.CoreSimulator.SimRuntime.iOS-17-2
    std::string device_type_id;     // com.apple.CoreSimulator.SimDeviceType.iPhone-15
    bool is_available = true;
};

struct Device {
    Platform platform = Platform::Android;
    std::string identifier;         // Unique within its family
    std::string name;               // Display name
    DeviceStatus status = DeviceStatus::Stopped;
    std::string status_message;     // Set when status == Error
    std::variant<AndroidAttributes, IosAttributes> attributes;

    [[nodiscard]] DeviceTag tag() const { return {platform, identifier}; }
    [[nodiscard]] bool is_running() const { return status == DeviceStatus::Running; }
};

// Expensive-to-fetch detail bag shown in the details panel
struct DeviceDetails {
    Platform platform = Platform::Android;
    std::string identifier;
    std::string name;
    std::string status;
    std::string version;            // "API 34 (Android 14)" or "iOS 17.2"
    std::string device_type;
    std::string ram;
    std::string storage;
    std::string resolution;
    std::string density;
    std::string path;
    std::string system_image;
    // Additional family-specific rows, in display order
    std::vector<std::pair<std::string, std::string>> extra;
};

// Validated creation request
struct DeviceConfig {
    Platform platform = Platform::Android;
    std::string name;
    std::string device_type;        // Android device profile id / iOS device type id
    std::string version;            // Android system image package / iOS runtime id
    int ram_mb = 0;                 // Android only, 0 = backend default
    int storage_mb = 0;             // Android only, 0 = backend default
};

// Choice offered by the creation form
struct DeviceTypeOption {
    std::string id;
    std::string display_name;
    std::string category;           // "phone", "tablet", ...
};

struct VersionOption {
    std::string id;
    std::string display_name;
};

const char* to_string(Platform platform);
const char* to_string(DeviceStatus status);

} // namespace emu
