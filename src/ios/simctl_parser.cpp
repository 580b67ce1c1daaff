#include "simctl_parser.hpp"
#include "../errors.hpp"
#include "../form_validation.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

using json = nlohmann::json;

namespace emu::ios {

namespace {

constexpr const char* kRuntimePrefix = "com.apple.CoreSimulator.SimRuntime.";
constexpr const char* kDeviceTypePrefix = "com.apple.CoreSimulator.SimDeviceType.";

json parse_json(const std::string& text, const char* what) {
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        throw DeviceError(ErrorKind::ParseFailure, std::string("Invalid simctl ") + what + " output: " + e.what());
    }
}

std::string string_field(const json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

bool bool_field(const json& object, const char* key, const bool fallback) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_boolean()) return fallback;
    return it->get<bool>();
}

std::string strip_prefix(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0 ? s.substr(prefix.length()) : s;
}

// "17.2" -> {17, 2}
std::vector<int> version_parts(const std::string& display_name) {
    std::vector<int> parts;
    const auto start = display_name.find_first_of("0123456789");
    if (start == std::string::npos) return parts;

    std::istringstream stream(display_name.substr(start));
    std::string token;
    while (std::getline(stream, token, '.')) {
        try {
            parts.push_back(std::stoi(token));
        } catch (const std::exception&) {
            break;
        }
    }
    return parts;
}

std::string family_category(const std::string& product_family, const std::string& id, const std::string& name) {
    if (product_family == "iPhone") return "phone";
    if (product_family == "iPad") return "tablet";
    if (product_family == "Apple Watch") return "wear";
    if (product_family == "Apple TV") return "tv";
    return infer_device_category(id, name);
}

} // namespace

std::vector<SimDevice> parse_device_list(const std::string& json_text) {
    const json root = parse_json(json_text, "device list");
    const auto devices_it = root.find("devices");
    if (devices_it == root.end() || !devices_it->is_object()) {
        throw DeviceError(ErrorKind::ParseFailure, "simctl device list has no \"devices\" object");
    }

    std::vector<SimDevice> result;
    for (const auto& [runtime_id, entries] : devices_it->items()) {
        if (!entries.is_array()) continue;

        for (const auto& entry : entries) {
            if (!entry.is_object()) continue;

            SimDevice sim;
            sim.udid = string_field(entry, "udid");
            if (sim.udid.empty()) continue;

            sim.name = string_field(entry, "name");
            sim.state = string_field(entry, "state");
            sim.runtime_id = runtime_id;
            sim.device_type_id = string_field(entry, "deviceTypeIdentifier");
            sim.data_path = string_field(entry, "dataPath");
            sim.log_path = string_field(entry, "logPath");
            sim.is_available = bool_field(entry, "isAvailable", true);
            result.push_back(std::move(sim));
        }
    }
    return result;
}

std::vector<DeviceTypeOption> parse_device_types(const std::string& json_text) {
    const json root = parse_json(json_text, "device type");
    std::vector<DeviceTypeOption> types;

    const auto it = root.find("devicetypes");
    if (it == root.end() || !it->is_array()) return types;

    for (const auto& entry : *it) {
        DeviceTypeOption option;
        option.id = string_field(entry, "identifier");
        if (option.id.empty()) continue;

        option.display_name = string_field(entry, "name");
        if (option.display_name.empty()) {
            option.display_name = device_type_display_name(option.id);
        }
        option.category = family_category(string_field(entry, "productFamily"), option.id, option.display_name);
        types.push_back(std::move(option));
    }
    return types;
}

std::vector<VersionOption> parse_runtimes(const std::string& json_text) {
    const json root = parse_json(json_text, "runtime");
    std::vector<VersionOption> runtimes;

    const auto it = root.find("runtimes");
    if (it == root.end() || !it->is_array()) return runtimes;

    for (const auto& entry : *it) {
        if (!bool_field(entry, "isAvailable", false)) continue;

        VersionOption option;
        option.id = string_field(entry, "identifier");
        if (option.id.empty()) continue;

        option.display_name = string_field(entry, "name");
        if (option.display_name.empty()) {
            const std::string version = string_field(entry, "version");
            option.display_name = version.empty() ? runtime_display_name(option.id) : "iOS " + version;
        }
        runtimes.push_back(std::move(option));
    }

    std::ranges::stable_sort(runtimes, [](const VersionOption& a, const VersionOption& b) {
        return version_parts(a.display_name) > version_parts(b.display_name);
    });
    return runtimes;
}

DeviceStatus parse_state(const std::string& state) {
    if (state == "Booted") return DeviceStatus::Running;
    if (state == "Booting") return DeviceStatus::Starting;
    if (state == "Shutdown") return DeviceStatus::Stopped;
    if (state == "Shutting Down") return DeviceStatus::Stopping;
    return DeviceStatus::Unknown;
}

std::string runtime_display_name(const std::string& runtime_id) {
    // "iOS-17-2"
    std::string rest = strip_prefix(runtime_id, kRuntimePrefix);
    const auto dash = rest.find('-');
    if (dash == std::string::npos) return rest;

    std::string version = rest.substr(dash + 1);
    std::ranges::replace(version, '-', '.');
    return rest.substr(0, dash) + " " + version;
}

std::string device_type_display_name(const std::string& device_type_id) {
    std::string name = strip_prefix(device_type_id, kDeviceTypePrefix);
    std::ranges::replace(name, '-', ' ');
    std::ranges::replace(name, '_', ' ');
    return name;
}

Device to_device(const SimDevice& sim) {
    Device device;
    device.platform = Platform::Ios;
    device.identifier = sim.udid;
    device.name = sim.name;
    device.status = parse_state(sim.state);

    IosAttributes attrs;
    attrs.runtime = runtime_display_name(sim.runtime_id);
    attrs.runtime_id = sim.runtime_id;
    attrs.device_type_id = sim.device_type_id;
    attrs.is_available = sim.is_available;
    device.attributes = std::move(attrs);
    return device;
}

std::optional<std::pair<LogLevel, std::string>> parse_compact_log_line(const std::string& line) {
    // Date must lead the line; this also drops the "Timestamp  Ty  Process" header
    if (line.size() < 11 || !std::isdigit(static_cast<unsigned char>(line[0])) || line[4] != '-') {
        return std::nullopt;
    }

    std::istringstream stream(line);
    std::string date;
    std::string time;
    std::string type;
    if (!(stream >> date >> time >> type)) {
        return std::nullopt;
    }

    std::string message;
    std::getline(stream, message);
    const auto begin = message.find_first_not_of(' ');
    message = begin == std::string::npos ? std::string{} : message.substr(begin);

    LogLevel level = LogLevel::Info;
    if (type == "E" || type == "F") {
        level = LogLevel::Error;
    } else if (type == "Db") {
        level = LogLevel::Debug;
    }
    return std::make_pair(level, std::move(message));
}

} // namespace emu::ios
