#pragma once

#include <dtop/core/event.hpp>
#include <vector>

namespace dtop {
namespace ui {

/**
 * @brief Translate a curses key code into intents
 *
 * One key may produce several intents (Up is select-previous in the list,
 * scroll-up in the log view and move-up in the action menu); the state
 * machine ignores the ones that do not apply to its current view. In text
 * entry mode keys go to the search editor instead.
 */
std::vector<AppEvent> mapKey(int ch, bool text_entry);

} // namespace ui
} // namespace dtop
