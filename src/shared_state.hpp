#pragma once

#include "app_state.hpp"
#include <atomic>
#include <cstdint>
#include <mutex>
#include <utility>

namespace emu {

// Exclusive-access handle around AppState.
// Every mutation is one short critical section; callers must not block or wait
// on external processes inside the callback.
class SharedState {
public:
    explicit SharedState(StateLimits limits = {})
        : state_(limits) {}

    SharedState(const SharedState&) = delete;
    SharedState& operator=(const SharedState&) = delete;

    // Expired notifications are pruned lazily at the start of every write.
    // Every write bumps the revision, so readers can skip unchanged frames.
    template <typename Fn>
    auto write(Fn&& fn) {
        std::lock_guard lock(mutex_);
        revision_.fetch_add(1, std::memory_order_relaxed);
        state_.prune_expired_notifications(AppState::Clock::now());
        return std::forward<Fn>(fn)(state_);
    }

    template <typename Fn>
    auto read(Fn&& fn) const {
        std::lock_guard lock(mutex_);
        return std::forward<Fn>(fn)(std::as_const(state_));
    }

    // Copy of the whole state (thread-safe)
    [[nodiscard]] AppState snapshot() const {
        std::lock_guard lock(mutex_);
        return state_;
    }

    [[nodiscard]] uint64_t revision() const { return revision_.load(std::memory_order_relaxed); }

private:
    mutable std::mutex mutex_;
    std::atomic<uint64_t> revision_{0};
    AppState state_;
};

} // namespace emu
