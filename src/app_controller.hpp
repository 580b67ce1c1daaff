#pragma once

#include "config.hpp"
#include "interfaces/i_device_manager.hpp"
#include "navigation.hpp"
#include "shared_state.hpp"
#include "task_coordinator.hpp"
#include <atomic>
#include <chrono>
#include <functional>

namespace emu {

// Executes the actions produced by the Navigator. Everything slow runs on the
// TaskCoordinator; results are written back through SharedState.
// Coordinator methods are never called from inside a SharedState::write callback.
class AppController {
public:
    using Clock = std::chrono::steady_clock;

    AppController(SharedState& state, TaskCoordinator& tasks,
                  IDeviceManager& android, IDeviceManager& ios,
                  const AppConfig& config);
    ~AppController();

    AppController(const AppController&) = delete;
    AppController& operator=(const AppController&) = delete;

    // Installs the task error handler and loads both device families
    void start();

    void dispatch(const Action& action);

    // Periodic work: auto-refresh of the device lists
    void tick(Clock::time_point now = Clock::now());

    [[nodiscard]] bool quit_requested() const { return quit_requested_.load(); }

private:
    using OperationFn = std::function<void(IDeviceManager&, const CancellationToken&)>;

    [[nodiscard]] IDeviceManager& manager(Platform platform);

    void refresh(Platform platform);
    void refresh_all();
    void run_refresh(Platform platform, const CancellationToken& token);

    // Debounced list refresh after the focused panel changes (event loop thread only)
    void on_focus_settled();
    // Restarts detail and log work for the current selection
    void on_selection_changed();
    void schedule_details(const DeviceTag& tag);
    void fetch_details(const DeviceTag& tag, const CancellationToken& token);
    void stream_logs(const DeviceTag& tag, const CancellationToken& token);

    void toggle_device(const DeviceTag& tag);
    void delete_device(const DeviceTag& tag);
    void wipe_device(const DeviceTag& tag);
    void submit_create(const DeviceConfig& config);
    void load_form_options();

    // Marks the device pending and runs the operation detached; the pending flag
    // is cleared on every exit path
    void run_operation(const DeviceTag& tag, OperationKind kind, OperationFn operation,
                       std::string success_message);

    SharedState& state_;
    TaskCoordinator& tasks_;
    IDeviceManager& android_;
    IDeviceManager& ios_;
    const AppConfig& config_;

    std::atomic<bool> quit_requested_{false};
    // Event loop thread only
    Platform last_focus_ = Platform::Android;
    Clock::time_point last_auto_refresh_;
};

} // namespace emu
