#pragma once

#include "cancellation.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace emu {

// Logical task categories; at most one live task per slot
enum class TaskSlot {
    AndroidRefresh,
    IosRefresh,
    DeviceDetails,
    LogStream,
    NavigationRefresh,
    FormOptions
};

using TaskFn = std::function<void(const CancellationToken&)>;

// Receives failures caught at the task boundary (task name, user-facing message)
using TaskErrorHandler = std::function<void(const std::string&, const std::string&)>;

// Owns every background unit of work. Each task runs on its own thread and
// observes a CancellationToken. Superseded tasks are cancelled, not awaited;
// their threads are joined later by reap_finished() or cancel_all().
class TaskCoordinator {
public:
    TaskCoordinator() = default;
    ~TaskCoordinator();

    TaskCoordinator(const TaskCoordinator&) = delete;
    TaskCoordinator& operator=(const TaskCoordinator&) = delete;

    // Must be set before the first spawn
    void set_error_handler(TaskErrorHandler handler);

    // Cancels the slot's live task (if any) and starts work in its place
    void spawn(TaskSlot slot, TaskFn work);

    // Debounced spawn: work starts only if no other spawn for the slot arrives within delay
    void spawn_after(TaskSlot slot, std::chrono::milliseconds delay, TaskFn work);

    // Slot-less task, used for device operations that may run side by side
    void spawn_detached(const std::string& name, TaskFn work);

    void cancel(TaskSlot slot);

    // Cancels every task and joins all threads; later spawns are ignored
    void cancel_all();

    // Joins threads whose work has completed
    void reap_finished();

    [[nodiscard]] bool is_active(TaskSlot slot) const;
    [[nodiscard]] size_t running_count() const;

private:
    struct Task {
        std::string name;
        CancellationToken token;
        std::shared_ptr<std::atomic<bool>> finished;
        std::thread thread;
    };

    std::shared_ptr<Task> start_task(const std::string& name, TaskFn work);
    void run_task(const std::string& name, const CancellationToken& token, const TaskFn& work) const;
    void reap_finished_locked();

    mutable std::mutex mutex_;
    std::map<TaskSlot, std::shared_ptr<Task>> slots_;
    std::vector<std::shared_ptr<Task>> retired_;
    TaskErrorHandler error_handler_;
    bool shutting_down_ = false;
};

const char* to_string(TaskSlot slot);

} // namespace emu
