#include <ncurses.h>
#include <algorithm>
#include <dtop/ui/format.hpp>
#include <dtop/ui/terminal_ui.hpp>
#include <string>
#include <vector>

namespace dtop {
namespace ui {

namespace {

// Column widths of the container table
constexpr int NAME_WIDTH = 28;
constexpr int ID_WIDTH = 13;
constexpr int HOST_WIDTH = 16;
constexpr int STATE_WIDTH = 11;
constexpr int HEALTH_WIDTH = 10;
constexpr int PERCENT_WIDTH = 8;
constexpr int RATE_WIDTH = 12;
constexpr int UPTIME_WIDTH = 10;

void printAt(int row, int col, const std::string& text, int max_width)
{
    if (max_width <= 0) {
        return;
    }
    mvaddnstr(row, col, text.c_str(), max_width);
}

int stateColor(ContainerState state)
{
    switch (state) {
        case ContainerState::Running:
            return COLOR_PAIR_RUNNING;
        case ContainerState::Paused:
        case ContainerState::Restarting:
        case ContainerState::Removing:
        case ContainerState::Created:
            return COLOR_PAIR_WARNING;
        default:
            return COLOR_PAIR_STOPPED;
    }
}

int healthColor(HealthStatus health)
{
    switch (health) {
        case HealthStatus::Healthy:
            return COLOR_PAIR_RUNNING;
        case HealthStatus::Starting:
            return COLOR_PAIR_WARNING;
        case HealthStatus::Unhealthy:
            return COLOR_PAIR_ERROR;
    }
    return COLOR_PAIR_DEFAULT;
}

std::string sortLabel(const SortState& sort)
{
    return std::string(toString(sort.field)) + (sort.direction == SortDirection::Ascending ? " asc" : " desc");
}

void drawBox(int top, int left, int height, int width)
{
    attron(COLOR_PAIR(COLOR_PAIR_DIALOG));
    for (int row = top; row < top + height; ++row) {
        mvhline(row, left, ' ', width);
    }
    mvhline(top, left, ACS_HLINE, width);
    mvhline(top + height - 1, left, ACS_HLINE, width);
    mvvline(top, left, ACS_VLINE, height);
    mvvline(top, left + width - 1, ACS_VLINE, height);
    mvaddch(top, left, ACS_ULCORNER);
    mvaddch(top, left + width - 1, ACS_URCORNER);
    mvaddch(top + height - 1, left, ACS_LLCORNER);
    mvaddch(top + height - 1, left + width - 1, ACS_LRCORNER);
    attroff(COLOR_PAIR(COLOR_PAIR_DIALOG));
}

const std::vector<std::pair<const char*, const char*>>& helpLines()
{
    static const std::vector<std::pair<const char*, const char*>> lines = {
        {"j/k, Up/Down", "Move selection or scroll logs"},
        {"Enter, x", "Open the action menu"},
        {"l, Right", "View logs of the selected container"},
        {"h, Left, Esc", "Close logs, menu, search or help"},
        {"g / G", "Scroll logs to top / bottom"},
        {"Ctrl+U, b", "Page up"},
        {"Ctrl+D, Space", "Page down"},
        {"r", "Load older log history"},
        {"/", "Filter by name, id or host"},
        {"a", "Toggle stopped containers"},
        {"f", "Cycle host filter"},
        {"s", "Cycle sort field"},
        {"u n c m", "Sort by uptime, name, cpu, memory"},
        {"o", "Open in external log viewer"},
        {"?", "Toggle this help"},
        {"q", "Quit"},
    };
    return lines;
}

} // namespace

TerminalUi::TerminalUi(Screen& screen, EventSender sender, KeyboardReader* keyboard)
    : screen_(screen), sender_(std::move(sender)), keyboard_(keyboard)
{}

void TerminalUi::render(const engine::AppState& state)
{
    if (keyboard_ != nullptr) {
        keyboard_->setTextEntry(std::holds_alternative<engine::views::SearchMode>(state.view()));
    }

    std::lock_guard<std::mutex> lock(screen_.mutex());

    int rows;
    int cols;
    getmaxyx(stdscr, rows, cols);
    erase();

    int top = drawHeader(state, cols);
    int footer_row = rows - 1;
    int bottom = drawNotifications(state, footer_row, cols);

    if (std::holds_alternative<engine::views::LogView>(state.view())) {
        drawLogView(state, top, bottom, cols);
    }
    else {
        drawContainerTable(state, top, bottom, cols);
    }

    drawFooter(state, footer_row, cols);

    if (!state.menuActions().empty()) {
        drawActionMenu(state, rows, cols);
    }
    if (state.showHelp()) {
        drawHelp(rows, cols);
    }

    refresh();
}

int TerminalUi::drawHeader(const engine::AppState& state, int cols)
{
    std::string title = " dtop ";
    std::string summary = " hosts: " + std::to_string(state.hosts().size()) +
                          "  containers: " + std::to_string(state.sortedKeys().size()) + "/" +
                          std::to_string(state.containers().size()) + "  sort: " + sortLabel(state.sortState());
    if (state.showAll()) {
        summary += "  [all]";
    }
    if (state.hostFilter()) {
        summary += "  host: " + *state.hostFilter();
    }

    attron(COLOR_PAIR(COLOR_PAIR_STATUS) | A_BOLD);
    mvhline(0, 0, ' ', cols);
    printAt(0, 0, title, cols);
    attroff(A_BOLD);
    printAt(0, static_cast<int>(title.size()), summary, cols - static_cast<int>(title.size()));
    attroff(COLOR_PAIR(COLOR_PAIR_STATUS));
    return 1;
}

void TerminalUi::drawContainerTable(const engine::AppState& state, int top, int bottom, int cols)
{
    std::string header = fitWidth("NAME", NAME_WIDTH) + fitWidth("ID", ID_WIDTH) + fitWidth("HOST", HOST_WIDTH) +
                         fitWidth("STATE", STATE_WIDTH) + fitWidth("HEALTH", HEALTH_WIDTH) +
                         fitWidth("CPU", PERCENT_WIDTH) + fitWidth("MEM", PERCENT_WIDTH) +
                         fitWidth("NET RX", RATE_WIDTH) + fitWidth("NET TX", RATE_WIDTH) + fitWidth("UPTIME", UPTIME_WIDTH);
    attron(COLOR_PAIR(COLOR_PAIR_HEADER) | A_BOLD);
    printAt(top, 0, header, cols);
    attroff(COLOR_PAIR(COLOR_PAIR_HEADER) | A_BOLD);

    int first_row = top + 1;
    int visible = std::max(0, bottom - first_row);
    const auto& keys = state.sortedKeys();
    if (keys.empty()) {
        printAt(first_row, 1, state.showAll() ? "No containers" : "No running containers (press a to show all)",
                cols - 1);
        return;
    }

    size_t selected = state.selected().value_or(0);
    size_t start = 0;
    if (visible > 0 && selected >= static_cast<size_t>(visible)) {
        start = selected - static_cast<size_t>(visible) + 1;
    }

    auto now = std::chrono::system_clock::now();
    for (int i = 0; i < visible && start + static_cast<size_t>(i) < keys.size(); ++i) {
        size_t index = start + static_cast<size_t>(i);
        const Container* c = state.container(keys[index]);
        if (c == nullptr) {
            continue;
        }
        int row = first_row + i;
        bool is_selected = state.selected() && *state.selected() == index;

        if (is_selected) {
            attron(COLOR_PAIR(COLOR_PAIR_SELECTED));
            mvhline(row, 0, ' ', cols);
        }

        int col = 0;
        auto cell = [&](const std::string& text, int width, int color) {
            if (!is_selected && color != 0) {
                attron(COLOR_PAIR(color));
            }
            printAt(row, col, fitWidth(text, static_cast<size_t>(width)), cols - col);
            if (!is_selected && color != 0) {
                attroff(COLOR_PAIR(color));
            }
            col += width;
        };

        cell(c->name, NAME_WIDTH, 0);
        cell(c->id, ID_WIDTH, 0);
        cell(c->host_id, HOST_WIDTH, 0);
        cell(toString(c->state), STATE_WIDTH, stateColor(c->state));
        cell(c->health ? toString(*c->health) : "-", HEALTH_WIDTH, c->health ? healthColor(*c->health) : 0);
        cell(formatPercent(c->stats.cpu), PERCENT_WIDTH, 0);
        cell(formatPercent(c->stats.memory), PERCENT_WIDTH, 0);
        cell(formatBytesRate(c->stats.network_rx_bytes_per_sec), RATE_WIDTH, 0);
        cell(formatBytesRate(c->stats.network_tx_bytes_per_sec), RATE_WIDTH, 0);
        cell(formatUptime(c->created, c->state, now), UPTIME_WIDTH, 0);

        if (is_selected) {
            attroff(COLOR_PAIR(COLOR_PAIR_SELECTED));
        }
    }
}

void TerminalUi::drawLogView(const engine::AppState& state, int top, int bottom, int cols)
{
    const engine::LogState* log = state.logState();
    if (log == nullptr) {
        return;
    }

    const Container* c = state.container(log->key);
    std::string title = "Logs: " + (c != nullptr ? c->name : log->key.container_id) + " (" + log->key.host_id + ")";
    if (log->fetching_older) {
        title += "  loading older...";
    }
    else if (log->initial_loaded && !log->has_more_history) {
        title += "  [start of history]";
    }
    if (log->at_bottom) {
        title += "  [follow]";
    }
    attron(COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);
    printAt(top, 0, title, cols);
    attroff(COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);

    int first_row = top + 1;
    size_t viewport = static_cast<size_t>(std::max(1, bottom - first_row));
    if (viewport != reported_viewport_ && viewport != state.viewportHeight()) {
        // The consumer thread is drawing; never block on a full queue here
        if (sender_.trySend(events::ViewportResized{viewport})) {
            reported_viewport_ = viewport;
        }
    }

    if (!log->initial_loaded && log->entries.empty()) {
        printAt(first_row, 1, "Loading logs...", cols - 1);
        return;
    }

    for (size_t i = 0; i < viewport && log->scroll_offset + i < log->entries.size(); ++i) {
        const LogEntry& entry = log->entries[log->scroll_offset + i];
        int row = first_row + static_cast<int>(i);
        std::string stamp = formatLogTimestamp(entry.timestamp);

        attron(COLOR_PAIR(COLOR_PAIR_TIMESTAMP) | A_BOLD);
        printAt(row, 0, stamp, cols);
        attroff(COLOR_PAIR(COLOR_PAIR_TIMESTAMP) | A_BOLD);
        int text_col = static_cast<int>(stamp.size()) + 1;
        printAt(row, text_col, entry.text, cols - text_col);
    }
}

void TerminalUi::drawActionMenu(const engine::AppState& state, int rows, int cols)
{
    std::vector<ContainerAction> actions = state.menuActions();
    const auto* menu = std::get_if<engine::views::ActionMenu>(&state.view());
    if (menu == nullptr) {
        return;
    }
    const Container* c = state.container(menu->key);

    int width = std::min(cols, 32);
    int height = static_cast<int>(actions.size()) + 2;
    int top = std::max(0, (rows - height) / 2);
    int left = std::max(0, (cols - width) / 2);
    drawBox(top, left, height, width);

    attron(COLOR_PAIR(COLOR_PAIR_DIALOG) | A_BOLD);
    printAt(top, left + 2, " " + (c != nullptr ? c->name : menu->key.container_id) + " ", width - 4);
    attroff(A_BOLD);

    for (size_t i = 0; i < actions.size(); ++i) {
        int row = top + 1 + static_cast<int>(i);
        bool is_selected = i == state.actionSelection();
        if (is_selected) {
            attron(A_REVERSE);
        }
        printAt(row, left + 2, fitWidth(toString(actions[i]), static_cast<size_t>(width - 4)), width - 4);
        if (is_selected) {
            attroff(A_REVERSE);
        }
    }
    attroff(COLOR_PAIR(COLOR_PAIR_DIALOG));
}

void TerminalUi::drawHelp(int rows, int cols)
{
    const auto& lines = helpLines();
    int width = std::min(cols, 56);
    int height = std::min(rows, static_cast<int>(lines.size()) + 2);
    int top = std::max(0, (rows - height) / 2);
    int left = std::max(0, (cols - width) / 2);
    drawBox(top, left, height, width);

    attron(COLOR_PAIR(COLOR_PAIR_DIALOG) | A_BOLD);
    printAt(top, left + 2, " Help - ? or Esc to close ", width - 4);
    attroff(COLOR_PAIR(COLOR_PAIR_DIALOG) | A_BOLD);

    for (int i = 0; i < height - 2; ++i) {
        int row = top + 1 + i;
        attron(COLOR_PAIR(COLOR_PAIR_DIALOG) | A_BOLD);
        printAt(row, left + 2, fitWidth(lines[static_cast<size_t>(i)].first, 16), width - 4);
        attroff(A_BOLD);
        printAt(row, left + 18, lines[static_cast<size_t>(i)].second, width - 20);
        attroff(COLOR_PAIR(COLOR_PAIR_DIALOG));
    }
}

int TerminalUi::drawNotifications(const engine::AppState& state, int bottom, int cols)
{
    int row = bottom;

    for (const auto& [host_id, record] : state.connectionErrors()) {
        --row;
        attron(COLOR_PAIR(COLOR_PAIR_ERROR));
        printAt(row, 0, host_id + ": " + record.message, cols);
        attroff(COLOR_PAIR(COLOR_PAIR_ERROR));
    }

    if (state.statusMessage()) {
        --row;
        int color = state.statusMessage()->is_error ? COLOR_PAIR_ERROR : COLOR_PAIR_TITLE;
        attron(COLOR_PAIR(color));
        printAt(row, 0, state.statusMessage()->text, cols);
        attroff(COLOR_PAIR(color));
    }

    bool searching = std::holds_alternative<engine::views::SearchMode>(state.view());
    if (searching || !state.searchInput().value().empty()) {
        --row;
        attron(COLOR_PAIR(COLOR_PAIR_SEARCH));
        mvhline(row, 0, ' ', cols);
        printAt(row, 0, "/" + state.searchInput().value(), cols);
        attroff(COLOR_PAIR(COLOR_PAIR_SEARCH));
        if (searching) {
            int cursor_col = 1 + static_cast<int>(state.searchInput().cursor());
            if (cursor_col < cols) {
                mvchgat(row, cursor_col, 1, A_REVERSE, COLOR_PAIR_SEARCH, nullptr);
            }
        }
    }

    return std::max(row, 2);
}

void TerminalUi::drawFooter(const engine::AppState& state, int row, int cols)
{
    std::string hints;
    if (std::holds_alternative<engine::views::LogView>(state.view())) {
        hints = " Esc back  j/k scroll  g/G top/bottom  r older  ? help  q quit";
    }
    else if (std::holds_alternative<engine::views::SearchMode>(state.view())) {
        hints = " Enter apply  Esc clear";
    }
    else {
        hints = " Enter actions  l logs  / search  a all  s sort  f host  ? help  q quit";
    }

    attron(COLOR_PAIR(COLOR_PAIR_STATUS));
    mvhline(row, 0, ' ', cols);
    printAt(row, 0, hints, cols);
    attroff(COLOR_PAIR(COLOR_PAIR_STATUS));
}

} // namespace ui
} // namespace dtop
