#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <dtop/core/logger.hpp>
#include <dtop/engine/app_state.hpp>

namespace dtop {
namespace engine {

namespace {

bool containsIgnoreCase(const std::string& haystack, const std::string& needle)
{
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    return it != haystack.end();
}

std::string trimTrailingSlashes(std::string url)
{
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

const char* progressVerb(ContainerAction action)
{
    switch (action) {
        case ContainerAction::Start:
            return "Starting";
        case ContainerAction::Stop:
            return "Stopping";
        case ContainerAction::Restart:
            return "Restarting";
        case ContainerAction::Remove:
            return "Removing";
    }
    return "Updating";
}

const char* pastVerb(ContainerAction action)
{
    switch (action) {
        case ContainerAction::Start:
            return "Started";
        case ContainerAction::Stop:
            return "Stopped";
        case ContainerAction::Restart:
            return "Restarted";
        case ContainerAction::Remove:
            return "Removed";
    }
    return "Updated";
}

} // namespace

bool detectSshSession()
{
    return std::getenv("SSH_CLIENT") != nullptr || std::getenv("SSH_TTY") != nullptr ||
           std::getenv("SSH_CONNECTION") != nullptr;
}

AppState::AppState(EngineServices& services, AppOptions options)
    : services_(services), options_(options), viewport_height_(std::max<size_t>(1, options.viewport_height))
{}

bool AppState::handleEvent(AppEvent event)
{
    auto* logger = Logger::getInstance();
    if (isHighFrequency(event)) {
        logger->trace("Handling {}", describe(event));
    }
    else {
        logger->debug("Handling {}", describe(event));
    }

    return std::visit([this](auto& e) { return handle(e); }, event);
}

bool AppState::onTick(std::chrono::steady_clock::time_point now)
{
    bool changed = false;

    for (auto it = connection_errors_.begin(); it != connection_errors_.end();) {
        if (now - it->second.at >= CONNECTION_ERROR_TTL) {
            it = connection_errors_.erase(it);
            changed = true;
        }
        else {
            ++it;
        }
    }

    if (status_ && now - status_->at >= STATUS_MESSAGE_TTL) {
        status_.reset();
        changed = true;
    }

    return changed;
}

const Container* AppState::container(const ContainerKey& key) const
{
    auto it = containers_.find(key);
    return it == containers_.end() ? nullptr : &it->second;
}

const Container* AppState::selectedContainer() const
{
    if (!selected_ || *selected_ >= sorted_keys_.size()) {
        return nullptr;
    }
    return container(sorted_keys_[*selected_]);
}

std::vector<ContainerAction> AppState::menuActions() const
{
    const ContainerKey* key = actionMenuKey();
    if (key == nullptr) {
        return {};
    }
    const Container* target = container(*key);
    return target == nullptr ? std::vector<ContainerAction>{} : availableActions(target->state);
}

// View helpers

bool AppState::inContainerList() const
{
    return std::holds_alternative<views::ContainerList>(view_);
}

bool AppState::inLogView() const
{
    return std::holds_alternative<views::LogView>(view_);
}

bool AppState::inSearchMode() const
{
    return std::holds_alternative<views::SearchMode>(view_);
}

const ContainerKey* AppState::actionMenuKey() const
{
    const auto* menu = std::get_if<views::ActionMenu>(&view_);
    return menu == nullptr ? nullptr : &menu->key;
}

// Projection

bool AppState::matchesFilters(const Container& container) const
{
    if (!show_all_ && container.state != ContainerState::Running) {
        return false;
    }
    if (host_filter_ && container.host_id != *host_filter_) {
        return false;
    }

    const std::string& query = search_.value();
    if (query.empty()) {
        return true;
    }
    return containsIgnoreCase(container.name, query) || containsIgnoreCase(container.id, query) ||
           containsIgnoreCase(container.host_id, query);
}

bool AppState::lessThan(const Container& a, const Container& b) const
{
    if (a.host_id != b.host_id) {
        return a.host_id < b.host_id;
    }

    const bool descending = sort_state_.direction == SortDirection::Descending;
    switch (sort_state_.field) {
        case SortField::Uptime:
            // Containers without a creation time go last in either direction
            if (a.created.has_value() != b.created.has_value()) {
                return a.created.has_value();
            }
            if (!a.created) {
                return false;
            }
            return descending ? *a.created > *b.created : *a.created < *b.created;
        case SortField::Name:
            return descending ? a.name > b.name : a.name < b.name;
        case SortField::Cpu:
            return descending ? a.stats.cpu > b.stats.cpu : a.stats.cpu < b.stats.cpu;
        case SortField::Memory:
            return descending ? a.stats.memory > b.stats.memory : a.stats.memory < b.stats.memory;
    }
    return false;
}

void AppState::rebuildProjection()
{
    sorted_keys_.clear();
    for (const auto& [key, container] : containers_) {
        if (matchesFilters(container)) {
            sorted_keys_.push_back(key);
        }
    }

    // Map iteration order is unspecified; start from id order so ties are deterministic
    std::sort(sorted_keys_.begin(), sorted_keys_.end(), [](const ContainerKey& a, const ContainerKey& b) {
        return a.container_id < b.container_id;
    });
    std::stable_sort(sorted_keys_.begin(), sorted_keys_.end(),
                     [this](const ContainerKey& a, const ContainerKey& b) {
                         return lessThan(containers_.at(a), containers_.at(b));
                     });
}

void AppState::adjustSelection()
{
    const size_t count = sorted_keys_.size();
    if (count == 0) {
        selected_.reset();
    }
    else if (!selected_) {
        selected_ = 0;
    }
    else if (*selected_ >= count) {
        selected_ = count - 1;
    }
}

void AppState::insertContainer(Container container)
{
    ContainerKey key = container.key();
    containers_.insert_or_assign(std::move(key), std::move(container));
}

// Container lifecycle

bool AppState::handle(events::InitialContainerList& event)
{
    for (auto& container : event.containers) {
        insertContainer(std::move(container));
    }
    rebuildProjection();
    adjustSelection();
    return true;
}

bool AppState::handle(events::ContainerCreated& event)
{
    insertContainer(std::move(event.container));
    rebuildProjection();
    adjustSelection();
    return true;
}

bool AppState::handle(events::ContainerDestroyed& event)
{
    if (containers_.erase(event.key) == 0) {
        return false;
    }

    const ContainerKey* menu_key = actionMenuKey();
    if (menu_key != nullptr && *menu_key == event.key) {
        view_ = views::ContainerList{};
    }

    rebuildProjection();
    adjustSelection();
    return true;
}

bool AppState::handle(events::ContainerStateChanged& event)
{
    auto it = containers_.find(event.key);
    if (it == containers_.end()) {
        return false;
    }
    it->second.state = event.state;
    rebuildProjection();
    adjustSelection();
    return true;
}

bool AppState::handle(events::ContainerStat& event)
{
    auto it = containers_.find(event.key);
    if (it != containers_.end()) {
        it->second.stats = event.stats;
    }
    return false;
}

bool AppState::handle(events::ContainerHealthChanged& event)
{
    auto it = containers_.find(event.key);
    if (it == containers_.end()) {
        return false;
    }
    it->second.health = event.health;
    return true;
}

// Connectivity

bool AppState::handle(events::ConnectionError& event)
{
    auto now = std::chrono::steady_clock::now();
    connection_errors_[event.host_id] = ConnectionErrorRecord{event.message, now};
    onTick(now);
    return true;
}

bool AppState::handle(events::HostConnected& event)
{
    HostId host_id = event.host.host_id;
    Logger::getInstance()->info("Host {} connected", host_id);

    connection_errors_.erase(host_id);
    hosts_[host_id] = event.host;
    monitors_.replace(host_id, services_.startHostMonitor(event.host));
    return true;
}

// Terminal and navigation

bool AppState::handle(events::Quit&)
{
    should_quit_ = true;
    return false;
}

bool AppState::handle(events::Resize&)
{
    return true;
}

bool AppState::handle(events::ViewportResized& event)
{
    size_t height = std::max<size_t>(1, event.height);
    if (height == viewport_height_) {
        return false;
    }
    viewport_height_ = height;

    if (log_) {
        size_t max_offset = maxScrollOffset();
        if (log_->at_bottom || log_->scroll_offset > max_offset) {
            log_->scroll_offset = max_offset;
        }
    }
    return true;
}

bool AppState::handle(events::SelectPrevious&)
{
    if (!inContainerList()) {
        return false;
    }
    if (selected_ && *selected_ > 0) {
        --*selected_;
    }
    return true;
}

bool AppState::handle(events::SelectNext&)
{
    if (!inContainerList()) {
        return false;
    }
    if (sorted_keys_.empty()) {
        return true;
    }
    if (!selected_) {
        selected_ = 0;
    }
    else if (*selected_ + 1 < sorted_keys_.size()) {
        ++*selected_;
    }
    return true;
}

bool AppState::handle(events::EnterPressed&)
{
    if (inSearchMode()) {
        // Keep the filter, leave the editor
        view_ = views::ContainerList{};
        return true;
    }
    if (inContainerList()) {
        events::ShowActionMenu show;
        return handle(show);
    }
    if (actionMenuKey() != nullptr) {
        events::ExecuteAction execute;
        return handle(execute);
    }
    return false;
}

bool AppState::handle(events::ExitView&)
{
    if (show_help_) {
        show_help_ = false;
        return true;
    }

    if (inSearchMode()) {
        events::ExitSearchMode exit;
        return handle(exit);
    }
    if (inLogView()) {
        closeLogView();
        return true;
    }
    if (actionMenuKey() != nullptr) {
        view_ = views::ContainerList{};
        action_selected_ = 0;
        return true;
    }
    return false;
}

bool AppState::handle(events::ToggleHelp&)
{
    show_help_ = !show_help_;
    return true;
}

// Log view

void AppState::closeLogView()
{
    if (log_) {
        log_->tail_task.cancel();
        log_->pagination_task.cancel();
        log_.reset();
    }
    view_ = views::ContainerList{};
}

size_t AppState::maxScrollOffset() const
{
    if (!log_ || log_->entries.size() <= viewport_height_) {
        return 0;
    }
    return log_->entries.size() - viewport_height_;
}

size_t AppState::pageSize() const
{
    return std::max<size_t>(1, viewport_height_ / 2);
}

bool AppState::maybeFetchOlderLogs(bool ignore_threshold)
{
    if (!log_ || !inLogView()) {
        return false;
    }
    LogState& log = *log_;
    if (!log.initial_loaded || !log.has_more_history || log.fetching_older || !log.oldest) {
        return false;
    }
    if (!ignore_threshold && log.scroll_offset > OLDER_LOGS_THRESHOLD) {
        return false;
    }

    auto host = hosts_.find(log.key.host_id);
    if (host == hosts_.end()) {
        return false;
    }

    LogPageRequest request;
    request.oldest_loaded = *log.oldest;
    request.batch_oldest = log.batch_oldest.value_or(*log.oldest);
    request.batch_newest = log.batch_newest.value_or(*log.oldest);
    if (const Container* target = container(log.key)) {
        request.created = target->created;
    }
    request.batch_size = options_.log_batch_size;

    log.fetching_older = true;
    log.pagination_task.replace(services_.fetchOlderLogs(host->second, log.key, log.session, request));
    return true;
}

bool AppState::handle(events::ShowLogView&)
{
    if (!inContainerList()) {
        return false;
    }
    const Container* target = selectedContainer();
    if (target == nullptr) {
        return false;
    }

    ContainerKey key = target->key();
    closeLogView();
    view_ = views::LogView{key};
    log_.emplace(key, next_log_session_++);

    auto host = hosts_.find(key.host_id);
    if (host != hosts_.end()) {
        log_->tail_task.replace(services_.startLogTail(host->second, key, log_->session));
    }
    return true;
}

bool AppState::handle(events::ScrollUp&)
{
    if (!inLogView() || !log_) {
        return false;
    }

    bool moved = false;
    if (log_->scroll_offset > 0) {
        --log_->scroll_offset;
        moved = true;
    }
    log_->at_bottom = false;
    bool fetching = maybeFetchOlderLogs(false);
    return moved || fetching;
}

bool AppState::handle(events::ScrollDown&)
{
    if (!inLogView() || !log_) {
        return false;
    }

    size_t max_offset = maxScrollOffset();
    if (log_->scroll_offset >= max_offset) {
        log_->at_bottom = true;
        return false;
    }
    ++log_->scroll_offset;
    log_->at_bottom = log_->scroll_offset == max_offset;
    return true;
}

bool AppState::handle(events::ScrollToTop&)
{
    if (!inLogView() || !log_) {
        return false;
    }
    log_->scroll_offset = 0;
    log_->at_bottom = false;
    maybeFetchOlderLogs(true);
    return true;
}

bool AppState::handle(events::ScrollToBottom&)
{
    if (!inLogView() || !log_) {
        return false;
    }
    log_->scroll_offset = maxScrollOffset();
    log_->at_bottom = true;
    return true;
}

bool AppState::handle(events::ScrollPageUp&)
{
    if (!inLogView() || !log_) {
        return false;
    }
    log_->scroll_offset -= std::min(pageSize(), log_->scroll_offset);
    log_->at_bottom = false;
    maybeFetchOlderLogs(false);
    return true;
}

bool AppState::handle(events::ScrollPageDown&)
{
    if (!inLogView() || !log_) {
        return false;
    }
    size_t max_offset = maxScrollOffset();
    log_->scroll_offset = std::min(log_->scroll_offset + pageSize(), max_offset);
    log_->at_bottom = log_->scroll_offset == max_offset;
    return true;
}

bool AppState::acceptsLogEvent(const ContainerKey& key, LogSessionId session) const
{
    return log_ && log_->key == key && log_->session == session;
}

bool AppState::handle(events::LogLine& event)
{
    if (!acceptsLogEvent(event.key, event.session)) {
        return false;
    }

    LogState& log = *log_;
    if (!log.oldest) {
        log.oldest = event.entry.timestamp;
    }
    log.newest = event.entry.timestamp;
    log.entries.push_back(std::move(event.entry));
    ++log.total_loaded;

    if (log.at_bottom) {
        log.scroll_offset = maxScrollOffset();
    }
    return true;
}

bool AppState::handle(events::LogBatchPrepend& event)
{
    if (!acceptsLogEvent(event.key, event.session)) {
        return false;
    }

    LogState& log = *log_;
    log.fetching_older = false;
    log.has_more_history = event.has_more_history;
    log.initial_loaded = true;

    if (event.entries.empty()) {
        return true;
    }

    const size_t added = event.entries.size();
    log.batch_oldest = event.entries.front().timestamp;
    log.batch_newest = event.entries.back().timestamp;
    log.oldest = event.entries.front().timestamp;
    if (!log.newest || *log.newest < event.entries.back().timestamp) {
        log.newest = event.entries.back().timestamp;
    }

    log.entries.insert(log.entries.begin(), std::make_move_iterator(event.entries.begin()),
                       std::make_move_iterator(event.entries.end()));
    log.total_loaded += added;

    if (log.at_bottom) {
        log.scroll_offset = maxScrollOffset();
    }
    else {
        // Keep the same line in view
        log.scroll_offset += added;
    }
    return true;
}

bool AppState::handle(events::RequestOlderLogs&)
{
    return maybeFetchOlderLogs(true);
}

bool AppState::handle(events::OpenExternalViewer&)
{
    if (!inContainerList() || options_.ssh_session) {
        return false;
    }
    const Container* target = selectedContainer();
    if (target == nullptr || !target->viewer_url) {
        return false;
    }

    services_.openUrl(trimTrailingSlashes(*target->viewer_url) + "/container/" + target->id);
    return false;
}

// Sorting and filtering

bool AppState::handle(events::CycleSortField&)
{
    if (!inContainerList()) {
        return false;
    }
    sort_state_ = SortState(nextSortField(sort_state_.field));
    rebuildProjection();
    adjustSelection();
    return true;
}

bool AppState::handle(events::SetSortField& event)
{
    if (!inContainerList()) {
        return false;
    }
    if (sort_state_.field == event.field) {
        sort_state_.direction = toggled(sort_state_.direction);
    }
    else {
        sort_state_ = SortState(event.field);
    }
    rebuildProjection();
    adjustSelection();
    return true;
}

bool AppState::handle(events::ToggleShowAll&)
{
    if (!inContainerList()) {
        return false;
    }
    show_all_ = !show_all_;
    rebuildProjection();
    adjustSelection();
    return true;
}

bool AppState::handle(events::CycleHostFilter&)
{
    if (!inContainerList()) {
        return false;
    }

    std::vector<HostId> host_ids;
    for (const auto& [host_id, host] : hosts_) {
        host_ids.push_back(host_id);
    }
    if (host_ids.empty()) {
        return false;
    }

    if (!host_filter_) {
        host_filter_ = host_ids.front();
    }
    else {
        auto it = std::upper_bound(host_ids.begin(), host_ids.end(), *host_filter_);
        if (it == host_ids.end()) {
            host_filter_.reset();
        }
        else {
            host_filter_ = *it;
        }
    }

    rebuildProjection();
    adjustSelection();
    return true;
}

bool AppState::handle(events::EnterSearchMode&)
{
    if (!inContainerList()) {
        return false;
    }
    view_ = views::SearchMode{};
    search_.reset();
    rebuildProjection();
    adjustSelection();
    return true;
}

bool AppState::handle(events::ExitSearchMode&)
{
    if (!inSearchMode()) {
        return false;
    }
    view_ = views::ContainerList{};
    search_.reset();
    rebuildProjection();
    adjustSelection();
    return true;
}

bool AppState::handle(events::SearchKeyEvent& event)
{
    if (!inSearchMode()) {
        return false;
    }
    if (event.key.code == KeyInput::Code::Enter || event.key.code == KeyInput::Code::Esc) {
        return false;
    }

    if (search_.handle(event.key)) {
        rebuildProjection();
        adjustSelection();
    }
    return true;
}

// Actions

bool AppState::handle(events::ShowActionMenu&)
{
    if (!inContainerList()) {
        return false;
    }
    const Container* target = selectedContainer();
    if (target == nullptr) {
        return false;
    }
    view_ = views::ActionMenu{target->key()};
    action_selected_ = 0;
    return true;
}

bool AppState::handle(events::SelectActionUp&)
{
    std::vector<ContainerAction> actions = menuActions();
    if (actions.empty() || action_selected_ == 0) {
        return false;
    }
    --action_selected_;
    return true;
}

bool AppState::handle(events::SelectActionDown&)
{
    std::vector<ContainerAction> actions = menuActions();
    if (actions.empty() || action_selected_ + 1 >= actions.size()) {
        return false;
    }
    ++action_selected_;
    return true;
}

bool AppState::handle(events::ExecuteAction&)
{
    const ContainerKey* key = actionMenuKey();
    if (key == nullptr) {
        return false;
    }

    std::vector<ContainerAction> actions = menuActions();
    if (action_selected_ >= actions.size()) {
        return false;
    }
    auto host = hosts_.find(key->host_id);
    if (host == hosts_.end()) {
        return false;
    }

    services_.executeAction(host->second, *key, actions[action_selected_]);
    view_ = views::ContainerList{};
    action_selected_ = 0;
    return true;
}

std::string AppState::containerLabel(const ContainerKey& key) const
{
    const Container* target = container(key);
    if (target != nullptr && !target->name.empty()) {
        return target->name;
    }
    return key.container_id;
}

void AppState::setStatus(std::string text, bool is_error)
{
    status_ = StatusMessage{std::move(text), is_error, std::chrono::steady_clock::now()};
}

bool AppState::handle(events::ActionInProgress& event)
{
    setStatus(std::string(progressVerb(event.action)) + " " + containerLabel(event.key) + "...", false);
    return true;
}

bool AppState::handle(events::ActionSuccess& event)
{
    setStatus(std::string(pastVerb(event.action)) + " " + containerLabel(event.key), false);
    return true;
}

bool AppState::handle(events::ActionError& event)
{
    setStatus(std::string(toString(event.action)) + " " + containerLabel(event.key) + " failed: " +
                  event.message,
              true);
    return true;
}

} // namespace engine
} // namespace dtop
