#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace emu {

// Cooperative cancellation flag shared between a task and its owner.
// Copies refer to the same underlying state.
class CancellationToken {
public:
    CancellationToken();

    void cancel() const;
    [[nodiscard]] bool is_cancelled() const;

    // Throws TaskCancelled once cancel() has been called
    void throw_if_cancelled() const;

    // Sleeps for the given duration or until cancelled.
    // Returns true if the full duration elapsed.
    [[nodiscard]] bool sleep_for(std::chrono::milliseconds duration) const;

    // Token that is never cancelled, for synchronous callers
    static CancellationToken none();

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::mutex mutex;
        std::condition_variable cv;
    };

    std::shared_ptr<State> state_;
};

} // namespace emu
