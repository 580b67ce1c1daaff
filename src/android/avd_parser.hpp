#pragma once

#include "../device.hpp"
#include "../viewmodels/log_panel_view_model.hpp"
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace emu::android {

// One block of `avdmanager list avd`
struct AvdEntry {
    std::string name;
    std::string device;     // Profile id, e.g. "pixel_7"
    std::string path;
    std::string target;     // Target plus "Based on:" text
    std::string abi;        // "google_apis/x86_64"
};

[[nodiscard]] std::vector<AvdEntry> parse_avd_list(const std::string& output);

// key=value lines of config.ini / hardware-qemu.ini
[[nodiscard]] std::map<std::string, std::string> parse_ini(const std::string& text);

// API level from "API level 34", "Android 14.0", or image.sysdir.1 in config.ini; 0 when unknown
[[nodiscard]] int parse_api_level(const std::string& target, const std::map<std::string, std::string>& config);

// "14" for 34, "8.1" for 27; empty when unknown
[[nodiscard]] std::string android_version_name(int api_level);

// Serials of attached emulators from `adb devices`
[[nodiscard]] std::vector<std::string> parse_adb_emulator_serials(const std::string& output);

// Profiles from `avdmanager list device`
[[nodiscard]] std::vector<DeviceTypeOption> parse_device_profiles(const std::string& output);

// Accepts "2048", "2048M", "2048MB", "8G" or a byte count; returns megabytes, 0 when unparsable
[[nodiscard]] int parse_size_mb(const std::string& value);

// One `logcat -v time` line: "01-15 12:34:56.789 E/Tag( 123): message"
[[nodiscard]] std::optional<std::pair<LogLevel, std::string>> parse_logcat_line(const std::string& line);

} // namespace emu::android
