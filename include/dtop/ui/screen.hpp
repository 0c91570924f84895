#pragma once

#include <mutex>

namespace dtop {
namespace ui {

// Color pair indices
enum ColorPair {
    COLOR_PAIR_DEFAULT = 1,
    COLOR_PAIR_TITLE,
    COLOR_PAIR_SELECTED,
    COLOR_PAIR_HEADER,
    COLOR_PAIR_STATUS,
    COLOR_PAIR_ERROR,
    COLOR_PAIR_WARNING,
    COLOR_PAIR_RUNNING,
    COLOR_PAIR_STOPPED,
    COLOR_PAIR_TIMESTAMP,
    COLOR_PAIR_SEARCH,
    COLOR_PAIR_DIALOG,
    COLOR_PAIR_HELP_KEY,
};

/**
 * @brief Owns the curses session
 *
 * ncurses is not thread-safe: the renderer and the keyboard reader take
 * mutex() around every curses call.
 */
class Screen {
public:
    Screen();
    ~Screen();

    Screen(const Screen&) = delete;
    Screen& operator=(const Screen&) = delete;

    // Leave curses mode; safe to call more than once
    void restore();

    /**
     * @brief Next key without blocking; ERR when none is pending
     */
    int pollKey();

    std::mutex& mutex()
    {
        return mutex_;
    }

private:
    void initColors();

    std::mutex mutex_;
    bool active_ = false;
};

} // namespace ui
} // namespace dtop
