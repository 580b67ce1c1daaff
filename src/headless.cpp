#include "headless.hpp"
#include "errors.hpp"
#include "form_validation.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <istream>
#include <ostream>
#include <vector>

namespace emu::headless {

namespace {

struct ResolvedDevice {
    IDeviceManager* manager = nullptr;
    Device device;
};

std::vector<IDeviceManager*> selected_managers(const Backends& backends, const std::optional<Platform> platform) {
    std::vector<IDeviceManager*> managers;
    if (!platform || *platform == Platform::Android) managers.push_back(&backends.android);
    if (!platform || *platform == Platform::Ios) managers.push_back(&backends.ios);
    return managers;
}

// Lists every requested family that is available. An explicitly requested family must be available.
std::vector<std::pair<IDeviceManager*, std::vector<Device>>> collect(const Backends& backends,
                                                                     const std::optional<Platform> platform,
                                                                     const CancellationToken& token) {
    std::vector<std::pair<IDeviceManager*, std::vector<Device>>> result;
    for (IDeviceManager* manager : selected_managers(backends, platform)) {
        if (!manager->is_available(token)) {
            if (platform) {
                throw DeviceError(ErrorKind::ToolNotFound,
                                  std::string(to_string(manager->platform())) + " tools are not available");
            }
            spdlog::debug("[Headless] Skipping {}: tools not available", to_string(manager->platform()));
            continue;
        }
        result.emplace_back(manager, manager->list_devices(token));
    }
    return result;
}

// Matches the backend identifier first, then the display name
ResolvedDevice resolve(const Backends& backends, const std::string& name, const std::optional<Platform> platform,
                       const CancellationToken& token) {
    const auto families = collect(backends, platform, token);

    for (const auto& [manager, devices] : families) {
        const auto it = std::ranges::find(devices, name, &Device::identifier);
        if (it != devices.end()) return {manager, *it};
    }
    for (const auto& [manager, devices] : families) {
        const auto it = std::ranges::find(devices, name, &Device::name);
        if (it != devices.end()) return {manager, *it};
    }
    throw DeviceError(ErrorKind::DeviceNotFound, "Device '" + name + "' not found");
}

std::string version_label(const Device& device) {
    if (const auto* android = std::get_if<AndroidAttributes>(&device.attributes)) {
        std::string label = "API " + std::to_string(android->api_level);
        if (!android->android_version.empty()) {
            label += " (Android " + android->android_version + ")";
        }
        return label;
    }
    return std::get<IosAttributes>(device.attributes).runtime;
}

bool confirm(const std::string& question, std::istream& in, std::ostream& out) {
    out << question << " [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(in, answer)) return false;
    std::ranges::transform(answer, answer.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return answer == "y" || answer == "yes";
}

} // namespace

std::optional<Platform> parse_platform(const std::string& text) {
    std::string lower = text;
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "android") return Platform::Android;
    if (lower == "ios") return Platform::Ios;
    if (lower == "all" || lower.empty()) return std::nullopt;
    throw DeviceError(ErrorKind::InvalidConfiguration, "Unknown platform '" + text + "' (expected android, ios or all)");
}

int list_devices(const Backends backends, const std::optional<Platform> platform, const bool json,
                 std::ostream& out) {
    const auto token = CancellationToken::none();
    const auto families = collect(backends, platform, token);

    if (json) {
        nlohmann::json array = nlohmann::json::array();
        for (const auto& [manager, devices] : families) {
            for (const auto& device : devices) {
                array.push_back({
                    {"platform", to_string(device.platform)},
                    {"identifier", device.identifier},
                    {"name", device.name},
                    {"status", to_string(device.status)},
                    {"version", version_label(device)},
                });
            }
        }
        out << array.dump(2) << '\n';
        return 0;
    }

    size_t count = 0;
    for (const auto& [manager, devices] : families) {
        out << to_string(manager->platform()) << " (" << devices.size() << ")\n";
        for (const auto& device : devices) {
            out << "  " << std::left << std::setw(32) << device.name
                << std::setw(10) << to_string(device.status)
                << version_label(device);
            if (device.identifier != device.name) {
                out << "  [" << device.identifier << "]";
            }
            out << '\n';
            ++count;
        }
    }
    if (families.empty()) {
        out << "No device tools available\n";
    } else if (count == 0) {
        out << "No devices found\n";
    }
    return 0;
}

int start_device(const Backends backends, const std::string& device, const std::optional<Platform> platform,
                 std::ostream& out) {
    const auto token = CancellationToken::none();
    const auto resolved = resolve(backends, device, platform, token);
    if (resolved.device.is_running()) {
        out << resolved.device.name << " is already running\n";
        return 0;
    }
    resolved.manager->start_device(resolved.device.identifier, token);
    out << "Started " << resolved.device.name << '\n';
    return 0;
}

int stop_device(const Backends backends, const std::string& device, const std::optional<Platform> platform,
                std::ostream& out) {
    const auto token = CancellationToken::none();
    const auto resolved = resolve(backends, device, platform, token);
    if (resolved.device.status == DeviceStatus::Stopped) {
        out << resolved.device.name << " is not running\n";
        return 0;
    }
    resolved.manager->stop_device(resolved.device.identifier, token);
    out << "Stopped " << resolved.device.name << '\n';
    return 0;
}

int delete_device(const Backends backends, const std::string& device, const std::optional<Platform> platform,
                  const bool assume_yes, std::istream& in, std::ostream& out) {
    const auto token = CancellationToken::none();
    const auto resolved = resolve(backends, device, platform, token);

    if (!assume_yes && !confirm("Delete " + resolved.device.name + "?", in, out)) {
        out << "Aborted\n";
        return 1;
    }
    resolved.manager->delete_device(resolved.device.identifier, token);
    out << "Deleted " << resolved.device.name << '\n';
    return 0;
}

int wipe_device(const Backends backends, const std::string& device, const std::optional<Platform> platform,
                const bool assume_yes, std::istream& in, std::ostream& out) {
    const auto token = CancellationToken::none();
    const auto resolved = resolve(backends, device, platform, token);

    if (!assume_yes && !confirm("Wipe all data of " + resolved.device.name + "?", in, out)) {
        out << "Aborted\n";
        return 1;
    }
    resolved.manager->wipe_device(resolved.device.identifier, token);
    out << "Wiped " << resolved.device.name << '\n';
    return 0;
}

int create_device(const Backends backends, const DeviceConfig& requested, std::ostream& out) {
    DeviceConfig config = requested;
    if (config.platform == Platform::Android) {
        // Unset sizes fall back to the form's defaults
        if (config.ram_mb == 0) config.ram_mb = kDefaultRamMb;
        if (config.storage_mb == 0) config.storage_mb = kDefaultStorageMb;
    }

    auto invalid = [](const std::string& field, const std::string& message) {
        return DeviceError(ErrorKind::InvalidConfiguration, field + ": " + message);
    };

    if (const auto error = validate_device_name(config.name, config.platform)) {
        throw invalid("Name", *error);
    }
    if (const auto error = validate_required_selection(!config.device_type.empty(), "device type")) {
        throw invalid("Device type", *error);
    }
    if (const auto error = validate_required_selection(!config.version.empty(), "version")) {
        throw invalid("Version", *error);
    }
    if (config.platform == Platform::Android) {
        if (const auto error = validate_numeric_range(std::to_string(config.ram_mb), kMinRamMb, kMaxRamMb, "MB")) {
            throw invalid("RAM", *error);
        }
        if (const auto error = validate_numeric_range(std::to_string(config.storage_mb), kMinStorageMb,
                                                      kMaxStorageMb, "MB")) {
            throw invalid("Storage", *error);
        }
    }

    const auto token = CancellationToken::none();
    IDeviceManager& manager = config.platform == Platform::Android ? backends.android : backends.ios;
    if (!manager.is_available(token)) {
        throw DeviceError(ErrorKind::ToolNotFound,
                          std::string(to_string(config.platform)) + " tools are not available");
    }

    manager.create_device(config, token);
    out << "Created " << config.name << '\n';
    return 0;
}

} // namespace emu::headless
