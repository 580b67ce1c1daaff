#pragma once

#include "interfaces/i_device_manager.hpp"
#include <iosfwd>
#include <optional>
#include <string>

namespace emu::headless {

// Non-interactive commands behind the CLI subcommands.
// Failures are thrown as DeviceError; the return value is the process exit code.

struct Backends {
    IDeviceManager& android;
    IDeviceManager& ios;
};

// Parses "android", "ios" or "all" (nullopt); throws DeviceError(InvalidConfiguration) otherwise
[[nodiscard]] std::optional<Platform> parse_platform(const std::string& text);

int list_devices(Backends backends, std::optional<Platform> platform, bool json, std::ostream& out);

int start_device(Backends backends, const std::string& device, std::optional<Platform> platform,
                 std::ostream& out);
int stop_device(Backends backends, const std::string& device, std::optional<Platform> platform,
                std::ostream& out);

// Without assume_yes the user is asked on `in`; anything but y/yes aborts with exit code 1
int delete_device(Backends backends, const std::string& device, std::optional<Platform> platform,
                  bool assume_yes, std::istream& in, std::ostream& out);
int wipe_device(Backends backends, const std::string& device, std::optional<Platform> platform,
                bool assume_yes, std::istream& in, std::ostream& out);

// Applies the creation form's validation rules before calling the backend.
// Android RAM and storage left at 0 take the form defaults.
int create_device(Backends backends, const DeviceConfig& config, std::ostream& out);

} // namespace emu::headless
