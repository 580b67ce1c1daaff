#include "task_coordinator.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

namespace emu {

const char* to_string(const TaskSlot slot) {
    switch (slot) {
        case TaskSlot::AndroidRefresh: return "android-refresh";
        case TaskSlot::IosRefresh: return "ios-refresh";
        case TaskSlot::DeviceDetails: return "device-details";
        case TaskSlot::LogStream: return "log-stream";
        case TaskSlot::NavigationRefresh: return "navigation-refresh";
        case TaskSlot::FormOptions: return "form-options";
    }
    return "task";
}

TaskCoordinator::~TaskCoordinator() {
    cancel_all();
}

void TaskCoordinator::set_error_handler(TaskErrorHandler handler) {
    std::lock_guard lock(mutex_);
    error_handler_ = std::move(handler);
}

void TaskCoordinator::spawn(const TaskSlot slot, TaskFn work) {
    std::lock_guard lock(mutex_);
    if (shutting_down_) return;

    reap_finished_locked();

    // Supersede: signal the old task, keep its thread for a later join
    if (const auto it = slots_.find(slot); it != slots_.end()) {
        it->second->token.cancel();
        retired_.push_back(std::move(it->second));
        slots_.erase(it);
    }

    slots_[slot] = start_task(to_string(slot), std::move(work));
}

void TaskCoordinator::spawn_after(const TaskSlot slot, const std::chrono::milliseconds delay,
                                  TaskFn work) {
    spawn(slot, [delay, work = std::move(work)](const CancellationToken& token) {
        if (!token.sleep_for(delay)) {
            return;
        }
        work(token);
    });
}

void TaskCoordinator::spawn_detached(const std::string& name, TaskFn work) {
    std::lock_guard lock(mutex_);
    if (shutting_down_) return;

    reap_finished_locked();
    retired_.push_back(start_task(name, std::move(work)));
}

void TaskCoordinator::cancel(const TaskSlot slot) {
    std::lock_guard lock(mutex_);
    if (const auto it = slots_.find(slot); it != slots_.end()) {
        it->second->token.cancel();
        retired_.push_back(std::move(it->second));
        slots_.erase(it);
    }
}

void TaskCoordinator::cancel_all() {
    std::vector<std::shared_ptr<Task>> tasks;
    {
        std::lock_guard lock(mutex_);
        shutting_down_ = true;
        for (auto& [slot, task] : slots_) {
            tasks.push_back(std::move(task));
        }
        slots_.clear();
        for (auto& task : retired_) {
            tasks.push_back(std::move(task));
        }
        retired_.clear();
    }

    for (const auto& task : tasks) {
        task->token.cancel();
    }

    // Join outside the lock: finishing tasks may still call back into the coordinator
    for (const auto& task : tasks) {
        if (task->thread.joinable()) {
            task->thread.join();
        }
    }

    if (!tasks.empty()) {
        spdlog::debug("[Tasks] Stopped {} background task(s)", tasks.size());
    }
}

void TaskCoordinator::reap_finished() {
    std::lock_guard lock(mutex_);
    reap_finished_locked();
}

void TaskCoordinator::reap_finished_locked() {
    auto join_if_finished = [](const std::shared_ptr<Task>& task) {
        if (!task->finished->load()) return false;
        if (task->thread.joinable()) {
            task->thread.join();
        }
        return true;
    };

    std::erase_if(retired_, join_if_finished);
    std::erase_if(slots_, [&](const auto& entry) {
        return join_if_finished(entry.second);
    });
}

bool TaskCoordinator::is_active(const TaskSlot slot) const {
    std::lock_guard lock(mutex_);
    const auto it = slots_.find(slot);
    return it != slots_.end() && !it->second->finished->load();
}

size_t TaskCoordinator::running_count() const {
    std::lock_guard lock(mutex_);
    size_t count = 0;
    for (const auto& [slot, task] : slots_) {
        if (!task->finished->load()) count++;
    }
    for (const auto& task : retired_) {
        if (!task->finished->load()) count++;
    }
    return count;
}

std::shared_ptr<TaskCoordinator::Task> TaskCoordinator::start_task(const std::string& name, TaskFn work) {
    auto task = std::make_shared<Task>();
    task->name = name;
    task->finished = std::make_shared<std::atomic<bool>>(false);

    task->thread = std::thread([this, name, token = task->token, finished = task->finished,
                                work = std::move(work)] {
        run_task(name, token, work);
        finished->store(true);
    });
    return task;
}

void TaskCoordinator::run_task(const std::string& name, const CancellationToken& token,
                               const TaskFn& work) const {
    std::string failure;

    try {
        token.throw_if_cancelled();
        work(token);
        return;
    } catch (const TaskCancelled&) {
        spdlog::trace("[Tasks] {} cancelled", name);
        return;
    } catch (const DeviceError& e) {
        failure = e.user_message();
    } catch (const std::exception& e) {
        failure = e.what();
    } catch (...) {
        failure = "unknown error";
    }

    // A task that failed because it was being torn down is not reported
    if (token.is_cancelled()) {
        spdlog::trace("[Tasks] {} failed after cancellation: {}", name, failure);
        return;
    }

    spdlog::error("[Tasks] {} failed: {}", name, failure);

    TaskErrorHandler handler;
    {
        std::lock_guard lock(mutex_);
        handler = error_handler_;
    }
    if (handler) {
        handler(name, failure);
    }
}

} // namespace emu
