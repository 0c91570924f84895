#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <dtop/core/event.hpp>
#include <dtop/core/task.hpp>
#include <dtop/core/types.hpp>
#include <dtop/engine/search_input.hpp>
#include <dtop/engine/services.hpp>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace dtop {
namespace engine {

// Lines from the top of the buffer at which older history is requested
constexpr size_t OLDER_LOGS_THRESHOLD = 10;

constexpr std::chrono::seconds CONNECTION_ERROR_TTL{10};
constexpr std::chrono::seconds STATUS_MESSAGE_TTL{5};

namespace views {

struct ContainerList {};
struct LogView {
    ContainerKey key;
};
struct ActionMenu {
    ContainerKey key;
};
struct SearchMode {};

} // namespace views

using ViewState = std::variant<views::ContainerList, views::LogView, views::ActionMenu, views::SearchMode>;

/**
 * @brief Buffer and scroll position of the open log view
 *
 * scroll_offset counts lines from the top of the buffer to the first visible
 * line. Destroying the state cancels its tasks.
 */
struct LogState {
    LogState(ContainerKey k, LogSessionId s) : key(std::move(k)), session(s) {}

    ContainerKey key;
    LogSessionId session;
    std::deque<LogEntry> entries;
    std::optional<Timestamp> oldest;
    std::optional<Timestamp> newest;
    std::optional<Timestamp> batch_oldest;
    std::optional<Timestamp> batch_newest;
    size_t scroll_offset = 0;
    bool at_bottom = true;
    bool initial_loaded = false;
    bool has_more_history = false;
    bool fetching_older = false;
    size_t total_loaded = 0;
    TaskSlot tail_task;
    TaskSlot pagination_task;
};

struct ConnectionErrorRecord {
    std::string message;
    std::chrono::steady_clock::time_point at;
};

struct StatusMessage {
    std::string text;
    bool is_error = false;
    std::chrono::steady_clock::time_point at;
};

struct AppOptions {
    size_t log_batch_size = 1000;
    bool ssh_session = false;
    size_t viewport_height = 20;
};

/**
 * @brief True when SSH_CLIENT, SSH_TTY or SSH_CONNECTION is set
 */
bool detectSshSession();

/**
 * @brief The dashboard's state machine
 *
 * Owns every piece of UI-visible state and is only touched from the event
 * loop thread. handleEvent() applies one event and reports whether the
 * change needs an immediate redraw; background work is requested from the
 * injected services and reports back as further events.
 */
class AppState {
public:
    AppState(EngineServices& services, AppOptions options = AppOptions());

    AppState(const AppState&) = delete;
    AppState& operator=(const AppState&) = delete;

    /**
     * @brief Apply an event
     * @return true if the screen should be redrawn now
     */
    bool handleEvent(AppEvent event);

    /**
     * @brief Periodic housekeeping; drops expired notifications
     * @return true if anything visible changed
     */
    bool onTick(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    // Read access for the renderer and tests
    bool shouldQuit() const
    {
        return should_quit_;
    }
    const ViewState& view() const
    {
        return view_;
    }
    const std::unordered_map<ContainerKey, Container, ContainerKeyHash>& containers() const
    {
        return containers_;
    }
    const Container* container(const ContainerKey& key) const;
    const std::vector<ContainerKey>& sortedKeys() const
    {
        return sorted_keys_;
    }
    std::optional<size_t> selected() const
    {
        return selected_;
    }
    const Container* selectedContainer() const;
    const SortState& sortState() const
    {
        return sort_state_;
    }
    bool showAll() const
    {
        return show_all_;
    }
    const std::optional<HostId>& hostFilter() const
    {
        return host_filter_;
    }
    const SearchInput& searchInput() const
    {
        return search_;
    }
    bool showHelp() const
    {
        return show_help_;
    }
    const LogState* logState() const
    {
        return log_ ? &*log_ : nullptr;
    }
    size_t actionSelection() const
    {
        return action_selected_;
    }
    std::vector<ContainerAction> menuActions() const;
    const std::map<HostId, ConnectionErrorRecord>& connectionErrors() const
    {
        return connection_errors_;
    }
    const std::optional<StatusMessage>& statusMessage() const
    {
        return status_;
    }
    const std::map<HostId, HostConnection>& hosts() const
    {
        return hosts_;
    }
    size_t viewportHeight() const
    {
        return viewport_height_;
    }

private:
    // Container lifecycle
    bool handle(events::InitialContainerList& event);
    bool handle(events::ContainerCreated& event);
    bool handle(events::ContainerDestroyed& event);
    bool handle(events::ContainerStateChanged& event);
    bool handle(events::ContainerStat& event);
    bool handle(events::ContainerHealthChanged& event);

    // Connectivity
    bool handle(events::ConnectionError& event);
    bool handle(events::HostConnected& event);

    // Terminal and navigation
    bool handle(events::Quit& event);
    bool handle(events::Resize& event);
    bool handle(events::ViewportResized& event);
    bool handle(events::SelectPrevious& event);
    bool handle(events::SelectNext& event);
    bool handle(events::EnterPressed& event);
    bool handle(events::ExitView& event);
    bool handle(events::ToggleHelp& event);

    // Log view
    bool handle(events::ShowLogView& event);
    bool handle(events::ScrollUp& event);
    bool handle(events::ScrollDown& event);
    bool handle(events::ScrollToTop& event);
    bool handle(events::ScrollToBottom& event);
    bool handle(events::ScrollPageUp& event);
    bool handle(events::ScrollPageDown& event);
    bool handle(events::LogLine& event);
    bool handle(events::LogBatchPrepend& event);
    bool handle(events::RequestOlderLogs& event);
    bool handle(events::OpenExternalViewer& event);

    // Sorting and filtering
    bool handle(events::CycleSortField& event);
    bool handle(events::SetSortField& event);
    bool handle(events::ToggleShowAll& event);
    bool handle(events::CycleHostFilter& event);
    bool handle(events::EnterSearchMode& event);
    bool handle(events::ExitSearchMode& event);
    bool handle(events::SearchKeyEvent& event);

    // Actions
    bool handle(events::ShowActionMenu& event);
    bool handle(events::SelectActionUp& event);
    bool handle(events::SelectActionDown& event);
    bool handle(events::ExecuteAction& event);
    bool handle(events::ActionInProgress& event);
    bool handle(events::ActionSuccess& event);
    bool handle(events::ActionError& event);

    bool inContainerList() const;
    bool inLogView() const;
    bool inSearchMode() const;
    const ContainerKey* actionMenuKey() const;

    void insertContainer(Container container);
    void rebuildProjection();
    void adjustSelection();
    bool matchesFilters(const Container& container) const;
    bool lessThan(const Container& a, const Container& b) const;

    void closeLogView();
    size_t maxScrollOffset() const;
    size_t pageSize() const;
    bool maybeFetchOlderLogs(bool ignore_threshold);
    bool acceptsLogEvent(const ContainerKey& key, LogSessionId session) const;

    void setStatus(std::string text, bool is_error);
    std::string containerLabel(const ContainerKey& key) const;

    EngineServices& services_;
    AppOptions options_;

    std::unordered_map<ContainerKey, Container, ContainerKeyHash> containers_;
    std::vector<ContainerKey> sorted_keys_;
    std::optional<size_t> selected_;

    ViewState view_ = views::ContainerList{};
    SortState sort_state_;
    bool show_all_ = false;
    std::optional<HostId> host_filter_;
    SearchInput search_;
    bool show_help_ = false;
    bool should_quit_ = false;

    std::optional<LogState> log_;
    LogSessionId next_log_session_ = 1;
    size_t viewport_height_;
    size_t action_selected_ = 0;

    std::map<HostId, HostConnection> hosts_;
    TaskMap<HostId> monitors_;
    std::map<HostId, ConnectionErrorRecord> connection_errors_;
    std::optional<StatusMessage> status_;
};

} // namespace engine
} // namespace dtop
