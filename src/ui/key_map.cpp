#include <ncurses.h>
#include <dtop/ui/key_map.hpp>

namespace dtop {
namespace ui {

namespace {

constexpr int KEY_ESCAPE = 27;
constexpr int KEY_DEL = 127;

int ctrl(char c)
{
    return c & 0x1f;
}

std::vector<AppEvent> searchKey(KeyInput::Code code, char ch = '\0')
{
    return {events::SearchKeyEvent{KeyInput{code, ch}}};
}

std::vector<AppEvent> mapTextEntryKey(int ch)
{
    switch (ch) {
        case '\n':
        case '\r':
        case KEY_ENTER:
            return {events::EnterPressed{}};
        case KEY_ESCAPE:
            return {events::ExitView{}};
        case KEY_BACKSPACE:
        case KEY_DEL:
        case '\b':
            return searchKey(KeyInput::Code::Backspace);
        case KEY_DC:
            return searchKey(KeyInput::Code::Delete);
        case KEY_LEFT:
            return searchKey(KeyInput::Code::Left);
        case KEY_RIGHT:
            return searchKey(KeyInput::Code::Right);
        case KEY_HOME:
            return searchKey(KeyInput::Code::Home);
        case KEY_END:
            return searchKey(KeyInput::Code::End);
        case KEY_RESIZE:
            return {events::Resize{}};
        default:
            break;
    }

    if (ch >= 32 && ch < 127) {
        return searchKey(KeyInput::Code::Char, static_cast<char>(ch));
    }
    return {};
}

} // namespace

std::vector<AppEvent> mapKey(int ch, bool text_entry)
{
    if (ch == ERR) {
        return {};
    }
    if (ch == ctrl('c')) {
        return {events::Quit{}};
    }
    if (text_entry) {
        return mapTextEntryKey(ch);
    }

    if (ch == ctrl('u')) {
        return {events::ScrollPageUp{}};
    }
    if (ch == ctrl('d')) {
        return {events::ScrollPageDown{}};
    }

    switch (ch) {
        case 'q':
            return {events::Quit{}};
        case KEY_RESIZE:
            return {events::Resize{}};
        case '/':
            return {events::EnterSearchMode{}};
        case KEY_UP:
        case 'k':
            return {events::SelectPrevious{}, events::ScrollUp{}, events::SelectActionUp{}};
        case KEY_DOWN:
        case 'j':
            return {events::SelectNext{}, events::ScrollDown{}, events::SelectActionDown{}};
        case '\n':
        case '\r':
        case KEY_ENTER:
            return {events::EnterPressed{}};
        case KEY_ESCAPE:
        case KEY_LEFT:
        case 'h':
            return {events::ExitView{}};
        case KEY_RIGHT:
        case 'l':
            return {events::ShowLogView{}};
        case 'x':
            return {events::ShowActionMenu{}};
        case 'o':
            return {events::OpenExternalViewer{}};
        case '?':
            return {events::ToggleHelp{}};
        case 's':
            return {events::CycleSortField{}};
        case 'u':
        case 'U':
            return {events::SetSortField{SortField::Uptime}};
        case 'n':
        case 'N':
            return {events::SetSortField{SortField::Name}};
        case 'c':
        case 'C':
            return {events::SetSortField{SortField::Cpu}};
        case 'm':
        case 'M':
            return {events::SetSortField{SortField::Memory}};
        case 'a':
        case 'A':
            return {events::ToggleShowAll{}};
        case 'f':
            return {events::CycleHostFilter{}};
        case 'g':
        case KEY_HOME:
            return {events::ScrollToTop{}};
        case 'G':
        case KEY_END:
            return {events::ScrollToBottom{}};
        case KEY_PPAGE:
        case 'b':
            return {events::ScrollPageUp{}};
        case KEY_NPAGE:
        case ' ':
            return {events::ScrollPageDown{}};
        case 'r':
            return {events::RequestOlderLogs{}};
        default:
            return {};
    }
}

} // namespace ui
} // namespace dtop
