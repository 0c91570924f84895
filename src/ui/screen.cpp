#include <ncurses.h>
#include <dtop/core/error.hpp>
#include <dtop/ui/screen.hpp>

namespace dtop {
namespace ui {

Screen::Screen()
{
    if (initscr() == nullptr) {
        throw DtopError(ErrorCode::SYSTEM_ERROR, "Failed to initialize the terminal");
    }
    active_ = true;

    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE);
    curs_set(0);
    set_escdelay(25);

    initColors();
}

Screen::~Screen()
{
    restore();
}

void Screen::restore()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_) {
        endwin();
        active_ = false;
    }
}

int Screen::pollKey()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_) {
        return ERR;
    }
    return getch();
}

void Screen::initColors()
{
    if (!has_colors()) {
        return;
    }

    start_color();
    use_default_colors();

    init_pair(COLOR_PAIR_DEFAULT, -1, -1);
    init_pair(COLOR_PAIR_TITLE, COLOR_CYAN, -1);
    init_pair(COLOR_PAIR_SELECTED, COLOR_BLACK, COLOR_CYAN);
    init_pair(COLOR_PAIR_HEADER, COLOR_YELLOW, -1);
    init_pair(COLOR_PAIR_STATUS, COLOR_WHITE, COLOR_BLUE);
    init_pair(COLOR_PAIR_ERROR, COLOR_RED, -1);
    init_pair(COLOR_PAIR_WARNING, COLOR_YELLOW, -1);
    init_pair(COLOR_PAIR_RUNNING, COLOR_GREEN, -1);
    init_pair(COLOR_PAIR_STOPPED, COLOR_RED, -1);
    init_pair(COLOR_PAIR_TIMESTAMP, COLOR_YELLOW, -1);
    init_pair(COLOR_PAIR_SEARCH, COLOR_BLACK, COLOR_YELLOW);
    init_pair(COLOR_PAIR_DIALOG, COLOR_WHITE, COLOR_BLUE);
    init_pair(COLOR_PAIR_HELP_KEY, COLOR_CYAN, -1);
}

} // namespace ui
} // namespace dtop
