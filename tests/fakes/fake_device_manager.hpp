#pragma once

#include "errors.hpp"
#include "interfaces/i_device_manager.hpp"
#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace emu::testing {

// Blocks callers until opened; a cancelled waiter leaves with TaskCancelled
class Gate {
public:
    explicit Gate(const bool open = true) : open_(open) {}

    void open() { open_ = true; }
    void close() { open_ = false; }

    void wait(const CancellationToken& token) {
        ++waiting_;
        while (!open_) {
            if (!token.sleep_for(std::chrono::milliseconds(1))) {
                --waiting_;
                throw TaskCancelled();
            }
        }
        --waiting_;
    }

    [[nodiscard]] int waiting() const { return waiting_.load(); }

private:
    std::atomic<bool> open_;
    std::atomic<int> waiting_{0};
};

// Controllable in-memory backend for controller and headless tests
class FakeDeviceManager : public IDeviceManager {
public:
    explicit FakeDeviceManager(const Platform platform) : platform_(platform) {}

    void set_devices(std::vector<Device> devices) {
        std::lock_guard lock(mutex_);
        devices_ = std::move(devices);
    }

    void set_available(const bool available) { available_ = available; }

    // The next call of the named operation ("start", "stop", "create", "delete", "wipe",
    // "details", "list", "options") throws this error
    void fail_next(const std::string& operation, const ErrorKind kind, const std::string& message) {
        std::lock_guard lock(mutex_);
        failures_.insert_or_assign(operation, DeviceError(kind, message));
    }

    void set_log_lines(const std::string& identifier, std::vector<std::pair<LogLevel, std::string>> lines) {
        std::lock_guard lock(mutex_);
        log_lines_[identifier] = std::move(lines);
    }

    Gate& operation_gate() { return operation_gate_; }
    Gate& details_gate() { return details_gate_; }
    Gate& list_gate() { return list_gate_; }

    [[nodiscard]] int list_calls() const { return list_calls_.load(); }
    [[nodiscard]] int details_calls() const { return details_calls_.load(); }
    [[nodiscard]] int log_streams() const { return log_streams_.load(); }
    [[nodiscard]] int options_calls() const { return options_calls_.load(); }

    [[nodiscard]] std::vector<std::string> calls() const {
        std::lock_guard lock(mutex_);
        return calls_;
    }

    [[nodiscard]] std::vector<std::string> detail_requests() const {
        std::lock_guard lock(mutex_);
        return detail_requests_;
    }

    [[nodiscard]] std::vector<DeviceConfig> created() const {
        std::lock_guard lock(mutex_);
        return created_;
    }

    [[nodiscard]] Platform platform() const override { return platform_; }

    bool is_available([[maybe_unused]] const CancellationToken& token) override { return available_; }

    std::vector<Device> list_devices(const CancellationToken& token) override {
        ++list_calls_;
        list_gate_.wait(token);
        std::lock_guard lock(mutex_);
        throw_if_failing("list");
        return devices_;
    }

    void start_device(const std::string& identifier, const CancellationToken& token) override {
        operation("start", identifier, token);
        std::lock_guard lock(mutex_);
        set_status_locked(identifier, DeviceStatus::Running);
    }

    void stop_device(const std::string& identifier, const CancellationToken& token) override {
        operation("stop", identifier, token);
        std::lock_guard lock(mutex_);
        set_status_locked(identifier, DeviceStatus::Stopped);
    }

    void create_device(const DeviceConfig& config, const CancellationToken& token) override {
        operation("create", config.name, token);
        std::lock_guard lock(mutex_);
        created_.push_back(config);
        Device device;
        device.platform = platform_;
        device.identifier = config.name;
        device.name = config.name;
        if (platform_ == Platform::Android) {
            device.attributes = AndroidAttributes{};
        } else {
            device.attributes = IosAttributes{};
        }
        devices_.push_back(std::move(device));
    }

    void delete_device(const std::string& identifier, const CancellationToken& token) override {
        operation("delete", identifier, token);
        std::lock_guard lock(mutex_);
        std::erase_if(devices_, [&](const Device& d) { return d.identifier == identifier; });
    }

    void wipe_device(const std::string& identifier, const CancellationToken& token) override {
        operation("wipe", identifier, token);
    }

    DeviceDetails get_device_details(const std::string& identifier, const CancellationToken& token) override {
        ++details_calls_;
        {
            std::lock_guard lock(mutex_);
            detail_requests_.push_back(identifier);
        }
        details_gate_.wait(token);

        std::lock_guard lock(mutex_);
        throw_if_failing("details");
        DeviceDetails details;
        details.platform = platform_;
        details.identifier = identifier;
        details.name = identifier;
        details.version = "details of " + identifier;
        return details;
    }

    void stream_logs(const std::string& identifier, const std::function<void(LogEntry)>& on_entry,
                     const CancellationToken& token) override {
        ++log_streams_;
        std::vector<std::pair<LogLevel, std::string>> lines;
        {
            std::lock_guard lock(mutex_);
            if (const auto it = log_lines_.find(identifier); it != log_lines_.end()) {
                lines = it->second;
            }
        }

        const DeviceTag source{platform_, identifier};
        for (auto& [level, message] : lines) {
            if (token.is_cancelled()) return;
            on_entry(LogEntry{std::chrono::system_clock::now(), level, source, message});
        }

        // Stay attached like a real stream until cancelled
        while (token.sleep_for(std::chrono::milliseconds(5))) {
        }
    }

    std::vector<DeviceTypeOption> list_device_types([[maybe_unused]] const CancellationToken& token) override {
        ++options_calls_;
        std::lock_guard lock(mutex_);
        throw_if_failing("options");
        return {{"pixel_7", "Pixel 7", "phone"}, {"pixel_tablet", "Pixel Tablet", "tablet"}};
    }

    std::vector<VersionOption> list_versions([[maybe_unused]] const CancellationToken& token) override {
        return {{"system-images;android-34;google_apis;x86_64", "API 34"}};
    }

private:
    void operation(const std::string& name, const std::string& identifier, const CancellationToken& token) {
        {
            std::lock_guard lock(mutex_);
            calls_.push_back(name + " " + identifier);
        }
        operation_gate_.wait(token);

        std::lock_guard lock(mutex_);
        throw_if_failing(name);
    }

    // Caller holds mutex_
    void throw_if_failing(const std::string& name) {
        const auto it = failures_.find(name);
        if (it == failures_.end()) return;
        const DeviceError error = it->second;
        failures_.erase(it);
        throw error;
    }

    // Caller holds mutex_
    void set_status_locked(const std::string& identifier, const DeviceStatus status) {
        for (auto& device : devices_) {
            if (device.identifier == identifier) device.status = status;
        }
    }

    Platform platform_;
    std::atomic<bool> available_{true};

    mutable std::mutex mutex_;
    std::vector<Device> devices_;
    std::map<std::string, DeviceError> failures_;
    std::map<std::string, std::vector<std::pair<LogLevel, std::string>>> log_lines_;
    std::vector<std::string> calls_;
    std::vector<std::string> detail_requests_;
    std::vector<DeviceConfig> created_;

    Gate operation_gate_;
    Gate details_gate_;
    Gate list_gate_;

    std::atomic<int> list_calls_{0};
    std::atomic<int> details_calls_{0};
    std::atomic<int> log_streams_{0};
    std::atomic<int> options_calls_{0};
};

} // namespace emu::testing
