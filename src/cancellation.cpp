#include "cancellation.hpp"
#include "errors.hpp"

namespace emu {

CancellationToken::CancellationToken()
    : state_(std::make_shared<State>()) {}

void CancellationToken::cancel() const {
    {
        std::lock_guard lock(state_->mutex);
        state_->cancelled = true;
    }
    state_->cv.notify_all();
}

bool CancellationToken::is_cancelled() const {
    return state_->cancelled;
}

void CancellationToken::throw_if_cancelled() const {
    if (state_->cancelled) {
        throw TaskCancelled();
    }
}

bool CancellationToken::sleep_for(const std::chrono::milliseconds duration) const {
    std::unique_lock lock(state_->mutex);
    return !state_->cv.wait_for(lock, duration, [this] {
        return state_->cancelled.load();
    });
}

CancellationToken CancellationToken::none() {
    return CancellationToken{};
}

} // namespace emu
