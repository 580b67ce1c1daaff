#pragma once

#include "device.hpp"
#include <optional>
#include <string>

namespace emu {

constexpr size_t kMaxDeviceNameLength = 50;
constexpr int kMinRamMb = 512;
constexpr int kMaxRamMb = 8192;
constexpr int kMinStorageMb = 1024;
constexpr int kMaxStorageMb = 65536;
constexpr int kDefaultRamMb = 2048;
constexpr int kDefaultStorageMb = 8192;

// Each validator returns the error text, or nullopt when the value is acceptable

[[nodiscard]] std::optional<std::string> validate_device_name(const std::string& name, Platform platform);

[[nodiscard]] std::optional<std::string> validate_numeric_range(const std::string& value,
                                                                int min, int max,
                                                                const std::string& unit);

[[nodiscard]] std::optional<std::string> validate_required_selection(bool has_selection,
                                                                     const std::string& field_name);

// Keyword-based category of a device profile ("phone", "tablet", "wear", "tv", "automotive", "desktop")
[[nodiscard]] std::string infer_device_category(const std::string& id, const std::string& display_name);

} // namespace emu
