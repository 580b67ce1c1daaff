#pragma once

#include "../device.hpp"
#include "../viewmodels/log_panel_view_model.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace emu::ios {

// One entry of `xcrun simctl list devices --json`
struct SimDevice {
    std::string udid;
    std::string name;
    std::string state;              // "Booted", "Shutdown", ...
    std::string runtime_id;
    std::string device_type_id;
    std::string data_path;
    std::string log_path;
    bool is_available = true;
};

// Throws DeviceError(ParseFailure) on malformed JSON
[[nodiscard]] std::vector<SimDevice> parse_device_list(const std::string& json_text);

// Available device types with their product family mapped to a form category
[[nodiscard]] std::vector<DeviceTypeOption> parse_device_types(const std::string& json_text);

// Available runtimes, newest first
[[nodiscard]] std::vector<VersionOption> parse_runtimes(const std::string& json_text);

[[nodiscard]] DeviceStatus parse_state(const std::string& state);

// com.apple.CoreSimulator.SimRuntime.iOS-17-2 -> "iOS 17.2"
[[nodiscard]] std::string runtime_display_name(const std::string& runtime_id);

// com.apple.CoreSimulator.SimDeviceType.iPhone-15-Pro -> "iPhone 15 Pro"
[[nodiscard]] std::string device_type_display_name(const std::string& device_type_id);

// Converts a listing entry to the common device model
[[nodiscard]] Device to_device(const SimDevice& sim);

// One `log stream --style compact` line: "2024-01-15 10:30:00.123 E  SpringBoard[52:1a3] message"
[[nodiscard]] std::optional<std::pair<LogLevel, std::string>> parse_compact_log_line(const std::string& line);

} // namespace emu::ios
