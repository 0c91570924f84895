#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <dtop/core/types.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace dtop {

namespace docker {
class DockerClient;
}

// Event system constants
constexpr size_t DEFAULT_CHANNEL_CAPACITY = 1000;
constexpr std::chrono::milliseconds DEFAULT_TICK_INTERVAL{500};

/**
 * @brief A daemon the engine can talk to, with the settings that travel with it
 */
struct HostConnection {
    HostId host_id;
    std::shared_ptr<docker::DockerClient> client;
    std::optional<std::string> viewer_url;
};

/**
 * @brief A keystroke forwarded to the search line editor
 */
struct KeyInput {
    enum class Code { Char, Backspace, Delete, Left, Right, Home, End, Enter, Esc };

    Code code = Code::Char;
    char ch = '\0';
};

namespace events {

// Container lifecycle (from the monitors)
struct InitialContainerList {
    HostId host_id;
    std::vector<Container> containers;
};
struct ContainerCreated {
    Container container;
};
struct ContainerDestroyed {
    ContainerKey key;
};
struct ContainerStateChanged {
    ContainerKey key;
    ContainerState state;
};
struct ContainerStat {
    ContainerKey key;
    ContainerStats stats;
};
struct ContainerHealthChanged {
    ContainerKey key;
    HealthStatus health;
};

// Connectivity
struct ConnectionError {
    HostId host_id;
    std::string message;
};
struct HostConnected {
    HostConnection host;
};

// Terminal and navigation
struct Quit {};
struct Resize {};
struct ViewportResized {
    size_t height;
};
struct SelectPrevious {};
struct SelectNext {};
struct EnterPressed {};
struct ExitView {}; // Esc: closes help, search, log view or action menu
struct ToggleHelp {};

// Log view
struct ShowLogView {};
struct ScrollUp {};
struct ScrollDown {};
struct ScrollToTop {};
struct ScrollToBottom {};
struct ScrollPageUp {};
struct ScrollPageDown {};
struct LogLine {
    ContainerKey key;
    LogEntry entry;
    LogSessionId session = 0;
};
struct LogBatchPrepend {
    ContainerKey key;
    std::vector<LogEntry> entries;
    bool has_more_history;
    LogSessionId session = 0;
};
struct RequestOlderLogs {};
struct OpenExternalViewer {};

// Sorting and filtering
struct CycleSortField {};
struct SetSortField {
    SortField field;
};
struct ToggleShowAll {};
struct CycleHostFilter {};
struct EnterSearchMode {};
struct ExitSearchMode {};
struct SearchKeyEvent {
    KeyInput key;
};

// Actions
struct ShowActionMenu {};
struct SelectActionUp {};
struct SelectActionDown {};
struct ExecuteAction {};
struct ActionInProgress {
    ContainerKey key;
    ContainerAction action;
};
struct ActionSuccess {
    ContainerKey key;
    ContainerAction action;
};
struct ActionError {
    ContainerKey key;
    ContainerAction action;
    std::string message;
};

} // namespace events

using AppEvent = std::variant<
    events::InitialContainerList, events::ContainerCreated, events::ContainerDestroyed,
    events::ContainerStateChanged, events::ContainerStat, events::ContainerHealthChanged,
    events::ConnectionError, events::HostConnected, events::Quit, events::Resize,
    events::ViewportResized, events::SelectPrevious, events::SelectNext, events::EnterPressed,
    events::ExitView, events::ToggleHelp, events::ShowLogView, events::ScrollUp,
    events::ScrollDown, events::ScrollToTop, events::ScrollToBottom, events::ScrollPageUp,
    events::ScrollPageDown, events::LogLine, events::LogBatchPrepend, events::RequestOlderLogs,
    events::OpenExternalViewer, events::CycleSortField, events::SetSortField,
    events::ToggleShowAll, events::CycleHostFilter, events::EnterSearchMode,
    events::ExitSearchMode, events::SearchKeyEvent, events::ShowActionMenu,
    events::SelectActionUp, events::SelectActionDown, events::ExecuteAction,
    events::ActionInProgress, events::ActionSuccess, events::ActionError>;

/**
 * @brief Short event name for diagnostics
 */
std::string describe(const AppEvent& event);

/**
 * @brief True for the high-frequency events logged at TRACE instead of DEBUG
 */
bool isHighFrequency(const AppEvent& event);

namespace detail {

struct ChannelState {
    explicit ChannelState(size_t cap) : capacity(cap) {}

    std::mutex mutex;
    std::condition_variable not_empty;
    std::condition_variable not_full;
    std::deque<AppEvent> queue;
    size_t capacity;
    size_t senders = 0;
    bool receiver_alive = true;
};

} // namespace detail

enum class RecvStatus { Event, Timeout, Closed };

/**
 * @brief Producer side of the event channel
 *
 * Copies share one queue. When the last sender is destroyed the receiver
 * drains what is left and then reports Closed.
 */
class EventSender {
public:
    EventSender() = default;
    explicit EventSender(std::shared_ptr<detail::ChannelState> state);
    EventSender(const EventSender& other);
    EventSender(EventSender&& other) noexcept;
    EventSender& operator=(const EventSender& other);
    EventSender& operator=(EventSender&& other) noexcept;
    ~EventSender();

    /**
     * @brief Enqueue an event, blocking while the queue is full
     * @return false once the receiver is gone
     */
    bool send(AppEvent event);

    /**
     * @brief Enqueue without blocking
     * @return false if the queue is full or the receiver is gone
     */
    bool trySend(AppEvent event);

    bool isConnected() const;

private:
    void release();

    std::shared_ptr<detail::ChannelState> state_;
};

/**
 * @brief Consumer side of the event channel; exactly one per channel
 */
class EventReceiver {
public:
    explicit EventReceiver(std::shared_ptr<detail::ChannelState> state);
    EventReceiver(EventReceiver&& other) noexcept = default;
    EventReceiver& operator=(EventReceiver&& other) noexcept = default;
    EventReceiver(const EventReceiver&) = delete;
    EventReceiver& operator=(const EventReceiver&) = delete;
    ~EventReceiver();

    RecvStatus recvTimeout(std::chrono::milliseconds timeout, AppEvent& out);
    bool tryRecv(AppEvent& out);
    size_t pending() const;

    // Wakes blocked senders; subsequent sends fail
    void close();

private:
    std::shared_ptr<detail::ChannelState> state_;
};

std::pair<EventSender, EventReceiver> makeEventChannel(size_t capacity = DEFAULT_CHANNEL_CAPACITY);

} // namespace dtop
