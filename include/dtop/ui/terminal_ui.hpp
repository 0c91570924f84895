#pragma once

#include <cstddef>
#include <dtop/core/event.hpp>
#include <dtop/engine/app_state.hpp>
#include <dtop/engine/event_loop.hpp>
#include <dtop/ui/keyboard.hpp>
#include <dtop/ui/screen.hpp>

namespace dtop {
namespace ui {

/**
 * @brief ncurses renderer for the dashboard
 *
 * Draws the container table, the log view, the action menu, the search bar,
 * notifications and the help overlay. Reports the log viewport height back
 * to the state machine as ViewportResized.
 */
class TerminalUi : public engine::Renderer {
public:
    TerminalUi(Screen& screen, EventSender sender, KeyboardReader* keyboard = nullptr);

    void render(const engine::AppState& state) override;

private:
    int drawHeader(const engine::AppState& state, int cols);
    void drawContainerTable(const engine::AppState& state, int top, int bottom, int cols);
    void drawLogView(const engine::AppState& state, int top, int bottom, int cols);
    void drawActionMenu(const engine::AppState& state, int rows, int cols);
    void drawHelp(int rows, int cols);
    int drawNotifications(const engine::AppState& state, int bottom, int cols);
    void drawFooter(const engine::AppState& state, int row, int cols);

    Screen& screen_;
    EventSender sender_;
    KeyboardReader* keyboard_;
    size_t reported_viewport_ = 0;
};

} // namespace ui
} // namespace dtop
