#include <dtop/core/logger.hpp>
#include <dtop/engine/event_loop.hpp>

namespace dtop {
namespace engine {

EventLoop::EventLoop(EventReceiver& receiver, AppState& state, Renderer& renderer,
                     std::chrono::milliseconds tick)
    : receiver_(receiver), state_(state), renderer_(renderer), tick_(tick)
{}

LoopStats EventLoop::run()
{
    renderer_.render(state_);
    ++stats_.renders;

    while (step()) {
    }

    Logger::getInstance()->info("Event loop finished after {} events and {} renders", stats_.events,
                                stats_.renders);
    return stats_;
}

bool EventLoop::step()
{
    AppEvent event;
    RecvStatus status = receiver_.recvTimeout(tick_, event);
    if (status == RecvStatus::Closed) {
        Logger::getInstance()->info("Event channel closed");
        return false;
    }

    bool redraw = false;
    if (status == RecvStatus::Timeout) {
        state_.onTick();
        redraw = true;
    }
    else {
        redraw = state_.handleEvent(std::move(event));
        ++stats_.events;

        while (receiver_.tryRecv(event)) {
            redraw = state_.handleEvent(std::move(event)) || redraw;
            ++stats_.events;
        }
    }

    if (state_.shouldQuit()) {
        return false;
    }

    if (redraw) {
        renderer_.render(state_);
        ++stats_.renders;
    }
    return true;
}

} // namespace engine
} // namespace dtop
