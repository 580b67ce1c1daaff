#include "event_loop.hpp"
#include <spdlog/spdlog.h>

namespace emu {

namespace {

// Redraw at least this often so time-based content (notification expiry) updates
constexpr auto kIdleRedrawInterval = std::chrono::milliseconds(250);

} // namespace

EventLoop::EventLoop(SharedState& state, TaskCoordinator& tasks, AppController& controller,
                     IInputSource& input, IRenderer& renderer, const AppConfig& config)
    : state_(state)
    , tasks_(tasks)
    , controller_(controller)
    , input_(input)
    , renderer_(renderer)
    , config_(config) {}

void EventLoop::run() {
    spdlog::info("[Loop] Started (frame {}ms, batch {} events)",
                 config_.frame_interval.count(), config_.max_events_per_frame);

    while (run_once()) {
    }

    tasks_.cancel_all();
    spdlog::info("[Loop] Stopped");
}

bool EventLoop::run_once() {
    navigator_.set_page_size(renderer_.page_size());

    // The first poll waits up to one frame; the rest of the batch only drains what is queued
    const auto batch_start = Clock::now();
    size_t handled = 0;
    auto timeout = config_.frame_interval;

    while (handled < config_.max_events_per_frame) {
        const auto event = input_.poll(timeout);
        if (!event) break;

        handle_event(*event);
        ++handled;

        timeout = std::chrono::milliseconds(0);
        if (Clock::now() - batch_start >= config_.event_batch_budget) {
            break;
        }
    }
    flush_moves();
    last_batch_size_ = handled;

    tasks_.reap_finished();
    controller_.tick();
    render_if_needed();

    return !controller_.quit_requested();
}

void EventLoop::handle_event(const KeyEvent& event) {
    if (event.key == Key::Resize) {
        force_render_ = true;
        return;
    }
    if (event.key == Key::Ignored) {
        return;
    }

    const Mode mode = state_.read([](const AppState& s) { return s.mode(); });
    if (const auto step = navigator_.list_step(mode, event)) {
        pending_steps_ += *step;
        return;
    }

    // Keep arrival order: queued moves land before this key
    flush_moves();

    const auto actions = state_.write([&](AppState& s) {
        return navigator_.handle_key(s, event);
    });
    dispatch(actions);
}

void EventLoop::flush_moves() {
    if (pending_steps_ == 0) return;

    const int steps = pending_steps_;
    pending_steps_ = 0;

    const auto actions = state_.write([&](AppState& s) {
        return navigator_.move_selection(s, steps);
    });
    dispatch(actions);
}

void EventLoop::dispatch(const std::vector<Action>& actions) {
    for (const auto& action : actions) {
        controller_.dispatch(action);
    }
}

void EventLoop::render_if_needed() {
    const auto now = Clock::now();
    const uint64_t revision = state_.revision();
    if (!force_render_ && revision == rendered_revision_ && now - last_render_ < kIdleRedrawInterval) {
        return;
    }

    state_.read([this](const AppState& s) { renderer_.render(s); });

    force_render_ = false;
    rendered_revision_ = revision;
    last_render_ = now;
}

} // namespace emu
