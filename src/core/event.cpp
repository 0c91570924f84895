#include <array>
#include <dtop/core/event.hpp>

namespace dtop {

namespace {

// Same order as the AppEvent alternatives
constexpr std::array<const char*, 41> EVENT_NAMES = {
    "InitialContainerList", "ContainerCreated", "ContainerDestroyed", "ContainerStateChanged",
    "ContainerStat", "ContainerHealthChanged", "ConnectionError", "HostConnected", "Quit",
    "Resize", "ViewportResized", "SelectPrevious", "SelectNext", "EnterPressed", "ExitView",
    "ToggleHelp", "ShowLogView", "ScrollUp", "ScrollDown", "ScrollToTop", "ScrollToBottom",
    "ScrollPageUp", "ScrollPageDown", "LogLine", "LogBatchPrepend", "RequestOlderLogs",
    "OpenExternalViewer", "CycleSortField", "SetSortField", "ToggleShowAll", "CycleHostFilter",
    "EnterSearchMode", "ExitSearchMode", "SearchKeyEvent", "ShowActionMenu", "SelectActionUp",
    "SelectActionDown", "ExecuteAction", "ActionInProgress", "ActionSuccess", "ActionError"};

static_assert(EVENT_NAMES.size() == std::variant_size_v<AppEvent>,
              "EVENT_NAMES must list every AppEvent alternative");

} // namespace

std::string describe(const AppEvent& event)
{
    std::string name = EVENT_NAMES[event.index()];

    if (const auto* list = std::get_if<events::InitialContainerList>(&event)) {
        name += "(" + list->host_id + ", " + std::to_string(list->containers.size()) + ")";
    }
    else if (const auto* created = std::get_if<events::ContainerCreated>(&event)) {
        name += "(" + created->container.host_id + "/" + created->container.id + ")";
    }
    else if (const auto* destroyed = std::get_if<events::ContainerDestroyed>(&event)) {
        name += "(" + destroyed->key.host_id + "/" + destroyed->key.container_id + ")";
    }
    else if (const auto* error = std::get_if<events::ConnectionError>(&event)) {
        name += "(" + error->host_id + ": " + error->message + ")";
    }
    else if (const auto* batch = std::get_if<events::LogBatchPrepend>(&event)) {
        name += "(" + std::to_string(batch->entries.size()) +
                (batch->has_more_history ? ", more)" : ", final)");
    }
    else if (const auto* action_error = std::get_if<events::ActionError>(&event)) {
        name += std::string("(") + toString(action_error->action) + ": " + action_error->message + ")";
    }

    return name;
}

bool isHighFrequency(const AppEvent& event)
{
    return std::holds_alternative<events::ContainerStat>(event) ||
           std::holds_alternative<events::LogLine>(event);
}

// EventSender implementation
EventSender::EventSender(std::shared_ptr<detail::ChannelState> state) : state_(std::move(state))
{
    if (state_) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->senders++;
    }
}

EventSender::EventSender(const EventSender& other) : EventSender(other.state_) {}

EventSender::EventSender(EventSender&& other) noexcept : state_(std::move(other.state_)) {}

EventSender& EventSender::operator=(const EventSender& other)
{
    if (this != &other) {
        EventSender copy(other);
        *this = std::move(copy);
    }
    return *this;
}

EventSender& EventSender::operator=(EventSender&& other) noexcept
{
    if (this != &other) {
        release();
        state_ = std::move(other.state_);
    }
    return *this;
}

EventSender::~EventSender()
{
    release();
}

void EventSender::release()
{
    if (!state_) {
        return;
    }

    bool last = false;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        last = --state_->senders == 0;
    }
    if (last) {
        state_->not_empty.notify_all();
    }
    state_.reset();
}

bool EventSender::send(AppEvent event)
{
    if (!state_) {
        return false;
    }

    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->not_full.wait(lock, [this] {
            return !state_->receiver_alive || state_->queue.size() < state_->capacity;
        });

        if (!state_->receiver_alive) {
            return false;
        }

        state_->queue.push_back(std::move(event));
    }

    state_->not_empty.notify_one();
    return true;
}

bool EventSender::trySend(AppEvent event)
{
    if (!state_) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->receiver_alive || state_->queue.size() >= state_->capacity) {
            return false;
        }
        state_->queue.push_back(std::move(event));
    }

    state_->not_empty.notify_one();
    return true;
}

bool EventSender::isConnected() const
{
    if (!state_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->receiver_alive;
}

// EventReceiver implementation
EventReceiver::EventReceiver(std::shared_ptr<detail::ChannelState> state) : state_(std::move(state))
{}

EventReceiver::~EventReceiver()
{
    close();
}

RecvStatus EventReceiver::recvTimeout(std::chrono::milliseconds timeout, AppEvent& out)
{
    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        bool ready = state_->not_empty.wait_for(lock, timeout, [this] {
            return !state_->queue.empty() || state_->senders == 0;
        });

        if (!ready) {
            return RecvStatus::Timeout;
        }
        if (state_->queue.empty()) {
            return RecvStatus::Closed;
        }

        out = std::move(state_->queue.front());
        state_->queue.pop_front();
    }

    state_->not_full.notify_one();
    return RecvStatus::Event;
}

bool EventReceiver::tryRecv(AppEvent& out)
{
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->queue.empty()) {
            return false;
        }
        out = std::move(state_->queue.front());
        state_->queue.pop_front();
    }

    state_->not_full.notify_one();
    return true;
}

size_t EventReceiver::pending() const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->queue.size();
}

void EventReceiver::close()
{
    if (!state_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->receiver_alive = false;
    }
    state_->not_full.notify_all();
}

std::pair<EventSender, EventReceiver> makeEventChannel(size_t capacity)
{
    auto state = std::make_shared<detail::ChannelState>(capacity);
    return {EventSender(state), EventReceiver(state)};
}

} // namespace dtop
