#pragma once

#include "app_controller.hpp"
#include "config.hpp"
#include "interfaces/i_input_source.hpp"
#include "interfaces/i_renderer.hpp"
#include "navigation.hpp"
#include "shared_state.hpp"
#include "task_coordinator.hpp"
#include <chrono>
#include <cstdint>

namespace emu {

// Single control-flow driver: polls input in bounded batches, routes keys through
// the Navigator, hands actions to the controller and renders once per iteration.
class EventLoop {
public:
    using Clock = std::chrono::steady_clock;

    EventLoop(SharedState& state, TaskCoordinator& tasks, AppController& controller,
              IInputSource& input, IRenderer& renderer, const AppConfig& config);

    // Runs until a quit action; cancels every background task on the way out
    void run();

    // One iteration: input batch, dispatch, housekeeping, render.
    // Returns false once quit has been requested.
    bool run_once();

    [[nodiscard]] const Navigator& navigator() const { return navigator_; }

    // Number of events handled by the most recent iteration
    [[nodiscard]] size_t last_batch_size() const { return last_batch_size_; }

private:
    void handle_event(const KeyEvent& event);
    // Applies coalesced single-step list moves as one move_by
    void flush_moves();
    void dispatch(const std::vector<Action>& actions);
    void render_if_needed();

    SharedState& state_;
    TaskCoordinator& tasks_;
    AppController& controller_;
    IInputSource& input_;
    IRenderer& renderer_;
    const AppConfig& config_;

    Navigator navigator_;
    int pending_steps_ = 0;
    size_t last_batch_size_ = 0;
    bool force_render_ = true;
    uint64_t rendered_revision_ = 0;
    Clock::time_point last_render_;
};

} // namespace emu
