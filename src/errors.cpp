#include "errors.hpp"

namespace emu {

const char* to_string(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ToolNotFound: return "tool not found";
        case ErrorKind::CommandFailed: return "command failed";
        case ErrorKind::DeviceNotFound: return "device not found";
        case ErrorKind::DeviceNotRunning: return "device not running";
        case ErrorKind::NameCollision: return "name collision";
        case ErrorKind::InvalidConfiguration: return "invalid configuration";
        case ErrorKind::ParseFailure: return "parse failure";
    }
    return "unknown error";
}

std::string DeviceError::user_message() const {
    const std::string detail = what();

    switch (kind_) {
        case ErrorKind::ToolNotFound:
            return detail.empty() ? "Required command-line tools not found" : detail;
        case ErrorKind::DeviceNotFound:
            return detail.empty() ? "Device not found" : detail;
        case ErrorKind::NameCollision:
            return detail.empty() ? "A device with this name already exists" : detail;
        case ErrorKind::DeviceNotRunning:
            return detail.empty() ? "Device is not running" : detail;
        default:
            break;
    }

    // Keep notifications to a single line
    std::string line = detail.substr(0, detail.find('\n'));
    if (line.length() > 120) {
        line = line.substr(0, 117) + "...";
    }
    if (line.empty()) {
        return to_string(kind_);
    }
    return line;
}

} // namespace emu
