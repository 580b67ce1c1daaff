#include "stub_device_manager.hpp"
#include "../errors.hpp"
#include "../form_validation.hpp"
#include "../ios/simctl_parser.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cstdio>

namespace emu {

namespace {

constexpr auto kLogInterval = std::chrono::milliseconds(400);

Device make_android(const std::string& name, const int api_level, const std::string& version,
                    const std::string& profile, const bool running) {
    Device device;
    device.platform = Platform::Android;
    device.identifier = name;
    device.name = name;
    std::ranges::replace(device.name, '_', ' ');
    device.status = running ? DeviceStatus::Running : DeviceStatus::Stopped;

    AndroidAttributes attrs;
    attrs.api_level = api_level;
    attrs.android_version = version;
    attrs.device_profile = profile;
    attrs.abi = "google_apis/x86_64";
    attrs.target = "Google APIs (Google Inc.)";
    attrs.path = "/home/demo/.android/avd/" + name + ".avd";
    attrs.ram_mb = kDefaultRamMb;
    attrs.storage_mb = kDefaultStorageMb;
    device.attributes = std::move(attrs);
    return device;
}

Device make_ios(const std::string& udid, const std::string& name, const std::string& runtime,
                const std::string& device_type, const bool running) {
    Device device;
    device.platform = Platform::Ios;
    device.identifier = udid;
    device.name = name;
    device.status = running ? DeviceStatus::Running : DeviceStatus::Stopped;

    IosAttributes attrs;
    attrs.runtime = runtime;
    std::string runtime_key = runtime;
    std::ranges::replace(runtime_key, ' ', '-');
    std::ranges::replace(runtime_key, '.', '-');
    attrs.runtime_id = "com.apple.CoreSimulator.SimRuntime." + runtime_key;
    attrs.device_type_id = "com.apple.CoreSimulator.SimDeviceType." + device_type;
    device.attributes = std::move(attrs);
    return device;
}

std::vector<Device> seed_fleet(const Platform platform) {
    if (platform == Platform::Android) {
        return {
            make_android("Pixel_7_API_34", 34, "14", "pixel_7", true),
            make_android("Pixel_Tablet_API_33", 33, "13", "pixel_tablet", false),
            make_android("Wear_OS_Round_API_30", 30, "11", "wearos_large_round", false),
            make_android("Pixel_4_API_29", 29, "10", "pixel_4", false),
        };
    }
    return {
        make_ios("8F1E3A52-1C7B-4D0A-9E55-0B6C2D7A1F01", "iPhone 15 Pro", "iOS 17.2", "iPhone-15-Pro", true),
        make_ios("2B7D9C41-6A3E-4F88-B1D2-7C5E9A0B3E02", "iPhone SE (3rd generation)", "iOS 17.2",
                 "iPhone-SE-3rd-generation", false),
        make_ios("C4A0E7F3-93B2-4E61-8D17-5F2B6C8D9A03", "iPad Air (5th generation)", "iOS 16.4",
                 "iPad-Air-5th-generation", false),
    };
}

// Cycles through a fixed set of plausible log lines
const std::array<std::pair<LogLevel, const char*>, 6> kLogScript = {{
    {LogLevel::Info, "ActivityManager: Start proc com.example.app"},
    {LogLevel::Debug, "Choreographer: Skipped 2 frames"},
    {LogLevel::Info, "NetworkMonitor: connectivity changed to WIFI"},
    {LogLevel::Warn, "PackageManager: Slow operation took 320ms"},
    {LogLevel::Debug, "SurfaceFlinger: vsync tick"},
    {LogLevel::Error, "AndroidRuntime: FATAL EXCEPTION in worker thread"},
}};

} // namespace

StubDeviceManager::StubDeviceManager(const Platform platform, const std::chrono::milliseconds latency)
    : platform_(platform)
    , latency_(latency)
    , devices_(seed_fleet(platform)) {}

void StubDeviceManager::set_devices(std::vector<Device> devices) {
    std::lock_guard lock(mutex_);
    devices_ = std::move(devices);
}

void StubDeviceManager::simulate_latency(const CancellationToken& token, const int factor) const {
    if (latency_.count() <= 0) {
        token.throw_if_cancelled();
        return;
    }
    if (!token.sleep_for(latency_ * factor)) {
        throw TaskCancelled();
    }
}

Device& StubDeviceManager::find_locked(const std::string& identifier) {
    const auto it = std::ranges::find(devices_, identifier, &Device::identifier);
    if (it == devices_.end()) {
        throw DeviceError(ErrorKind::DeviceNotFound, "Device '" + identifier + "' not found");
    }
    return *it;
}

bool StubDeviceManager::is_available([[maybe_unused]] const CancellationToken& token) {
    return true;
}

std::vector<Device> StubDeviceManager::list_devices(const CancellationToken& token) {
    simulate_latency(token);
    std::lock_guard lock(mutex_);
    return devices_;
}

void StubDeviceManager::start_device(const std::string& identifier, const CancellationToken& token) {
    simulate_latency(token, 3);
    std::lock_guard lock(mutex_);
    Device& device = find_locked(identifier);
    if (device.is_running()) return;

    device.status = DeviceStatus::Running;
    if (auto* attrs = std::get_if<AndroidAttributes>(&device.attributes)) {
        attrs->serial = "emulator-" + std::to_string(next_serial_);
        next_serial_ += 2;
    }
    spdlog::info("[Stub] Started {}", identifier);
}

void StubDeviceManager::stop_device(const std::string& identifier, const CancellationToken& token) {
    simulate_latency(token, 2);
    std::lock_guard lock(mutex_);
    Device& device = find_locked(identifier);
    device.status = DeviceStatus::Stopped;
    if (auto* attrs = std::get_if<AndroidAttributes>(&device.attributes)) {
        attrs->serial.clear();
    }
    spdlog::info("[Stub] Stopped {}", identifier);
}

void StubDeviceManager::create_device(const DeviceConfig& config, const CancellationToken& token) {
    simulate_latency(token, 4);
    std::lock_guard lock(mutex_);
    if (std::ranges::any_of(devices_, [&](const Device& d) { return d.name == config.name || d.identifier == config.name; })) {
        throw DeviceError(ErrorKind::NameCollision, "Device '" + config.name + "' already exists");
    }

    if (platform_ == Platform::Android) {
        Device device = make_android(config.name, 0, "", config.device_type, false);
        device.name = config.name;
        auto& attrs = std::get<AndroidAttributes>(device.attributes);
        // "system-images;android-34;google_apis;x86_64"
        if (const auto pos = config.version.find("android-"); pos != std::string::npos) {
            try {
                attrs.api_level = std::stoi(config.version.substr(pos + 8));
            } catch (const std::exception&) {
                attrs.api_level = 0;
            }
        }
        attrs.ram_mb = config.ram_mb > 0 ? config.ram_mb : kDefaultRamMb;
        attrs.storage_mb = config.storage_mb > 0 ? config.storage_mb : kDefaultStorageMb;
        devices_.push_back(std::move(device));
    } else {
        char udid[40];
        std::snprintf(udid, sizeof(udid), "00000000-0000-4000-8000-%012d", next_serial_++);
        Device device = make_ios(udid, config.name, ios::runtime_display_name(config.version), "", false);
        auto& attrs = std::get<IosAttributes>(device.attributes);
        attrs.runtime_id = config.version;
        attrs.device_type_id = config.device_type;
        devices_.push_back(std::move(device));
    }
    spdlog::info("[Stub] Created {}", config.name);
}

void StubDeviceManager::delete_device(const std::string& identifier, const CancellationToken& token) {
    simulate_latency(token, 2);
    std::lock_guard lock(mutex_);
    find_locked(identifier);
    std::erase_if(devices_, [&](const Device& d) { return d.identifier == identifier; });
    spdlog::info("[Stub] Deleted {}", identifier);
}

void StubDeviceManager::wipe_device(const std::string& identifier, const CancellationToken& token) {
    simulate_latency(token, 2);
    std::lock_guard lock(mutex_);
    Device& device = find_locked(identifier);
    device.status = DeviceStatus::Stopped;
    spdlog::info("[Stub] Wiped {}", identifier);
}

DeviceDetails StubDeviceManager::get_device_details(const std::string& identifier, const CancellationToken& token) {
    simulate_latency(token);
    std::lock_guard lock(mutex_);
    const Device& device = find_locked(identifier);

    DeviceDetails details;
    details.platform = device.platform;
    details.identifier = device.identifier;
    details.name = device.name;
    details.status = to_string(device.status);

    if (const auto* attrs = std::get_if<AndroidAttributes>(&device.attributes)) {
        details.version = "API " + std::to_string(attrs->api_level);
        if (!attrs->android_version.empty()) {
            details.version += " (Android " + attrs->android_version + ")";
        }
        details.device_type = attrs->device_profile;
        details.ram = std::to_string(attrs->ram_mb) + " MB";
        details.storage = std::to_string(attrs->storage_mb) + " MB";
        details.resolution = "1080x2400";
        details.density = "420 dpi";
        details.path = attrs->path;
        details.system_image = "system-images/android-" + std::to_string(attrs->api_level) + "/google_apis/x86_64/";
        details.extra.emplace_back("ABI", attrs->abi);
        if (!attrs->serial.empty()) {
            details.extra.emplace_back("Serial", attrs->serial);
        }
    } else {
        const auto& ios_attrs = std::get<IosAttributes>(device.attributes);
        details.version = ios_attrs.runtime;
        details.device_type = ios_attrs.device_type_id;
        details.path = "/Users/demo/Library/Developer/CoreSimulator/Devices/" + device.identifier + "/data";
        details.extra.emplace_back("UDID", device.identifier);
    }
    return details;
}

void StubDeviceManager::stream_logs(const std::string& identifier,
                                    const std::function<void(LogEntry)>& on_entry,
                                    const CancellationToken& token) {
    {
        std::lock_guard lock(mutex_);
        if (!find_locked(identifier).is_running()) return;
    }

    const DeviceTag source{platform_, identifier};
    size_t line = 0;
    while (token.sleep_for(kLogInterval)) {
        const auto& [level, message] = kLogScript[line % kLogScript.size()];
        on_entry(LogEntry{std::chrono::system_clock::now(), level, source, message});
        ++line;
    }
}

std::vector<DeviceTypeOption> StubDeviceManager::list_device_types(const CancellationToken& token) {
    simulate_latency(token);
    if (platform_ == Platform::Android) {
        return {
            {"pixel_7", "Pixel 7", "phone"},
            {"pixel_fold", "Pixel Fold", "phone"},
            {"pixel_tablet", "Pixel Tablet", "tablet"},
            {"wearos_large_round", "Wear OS Large Round", "wear"},
            {"tv_1080p", "Television (1080p)", "tv"},
            {"automotive_1024p_landscape", "Automotive (1024p landscape)", "automotive"},
            {"desktop_medium", "Medium Desktop", "desktop"},
        };
    }
    return {
        {"com.apple.CoreSimulator.SimDeviceType.iPhone-15-Pro", "iPhone 15 Pro", "phone"},
        {"com.apple.CoreSimulator.SimDeviceType.iPhone-15", "iPhone 15", "phone"},
        {"com.apple.CoreSimulator.SimDeviceType.iPad-Air-5th-generation", "iPad Air (5th generation)", "tablet"},
    };
}

std::vector<VersionOption> StubDeviceManager::list_versions(const CancellationToken& token) {
    simulate_latency(token);
    if (platform_ == Platform::Android) {
        return {
            {"system-images;android-34;google_apis;x86_64", "API 34 (Android 14) google_apis x86_64"},
            {"system-images;android-33;google_apis;x86_64", "API 33 (Android 13) google_apis x86_64"},
        };
    }
    return {
        {"com.apple.CoreSimulator.SimRuntime.iOS-17-2", "iOS 17.2"},
        {"com.apple.CoreSimulator.SimRuntime.iOS-16-4", "iOS 16.4"},
    };
}

} // namespace emu
