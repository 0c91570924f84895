#pragma once

#include <chrono>
#include <dtop/core/event.hpp>
#include <dtop/engine/app_state.hpp>

namespace dtop {
namespace engine {

/**
 * @brief Draws the state; implemented by the terminal UI
 */
class Renderer {
public:
    virtual ~Renderer() = default;
    virtual void render(const AppState& state) = 0;
};

struct LoopStats {
    size_t events = 0;
    size_t renders = 0;
};

/**
 * @brief Single consumer of the event channel
 *
 * Waits up to one tick for an event, applies it, drains whatever else is
 * already queued, then redraws once if any event asked for it or the wait
 * timed out. Returns when the state requests quit or every sender is gone.
 */
class EventLoop {
public:
    EventLoop(EventReceiver& receiver, AppState& state, Renderer& renderer,
              std::chrono::milliseconds tick = DEFAULT_TICK_INTERVAL);

    LoopStats run();

    /**
     * @brief One wait / apply / drain / redraw cycle
     * @return false once the loop should stop
     */
    bool step();

private:
    EventReceiver& receiver_;
    AppState& state_;
    Renderer& renderer_;
    std::chrono::milliseconds tick_;
    LoopStats stats_;
};

} // namespace engine
} // namespace dtop
