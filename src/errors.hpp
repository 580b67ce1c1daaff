#pragma once

#include <stdexcept>
#include <string>

namespace emu {

enum class ErrorKind {
    ToolNotFound,
    CommandFailed,
    DeviceNotFound,
    DeviceNotRunning,
    NameCollision,
    InvalidConfiguration,
    ParseFailure
};

// Failure reported by a device backend or the command executor
class DeviceError : public std::runtime_error {
public:
    DeviceError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const { return kind_; }

    // Short text suitable for a notification line
    [[nodiscard]] std::string user_message() const;

private:
    ErrorKind kind_;
};

// Thrown inside task bodies once cancellation has been observed.
// Swallowed silently by the task coordinator.
class TaskCancelled : public std::exception {
public:
    [[nodiscard]] const char* what() const noexcept override { return "task cancelled"; }
};

const char* to_string(ErrorKind kind);

} // namespace emu
