#pragma once

#include <chrono>
#include <cstddef>
#include <dtop/core/event.hpp>
#include <dtop/core/task.hpp>
#include <dtop/core/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace dtop {
namespace engine {

/**
 * @brief Everything a backward log fetch needs to know about the loaded buffer
 */
struct LogPageRequest {
    Timestamp oldest_loaded;
    Timestamp batch_oldest; // bounds of the most recently loaded batch
    Timestamp batch_newest;
    std::optional<Timestamp> created;
    size_t batch_size = 1000;
};

/**
 * @brief Side effects the state machine delegates to background work
 *
 * AppState never performs I/O itself; it asks these services for tasks and
 * stores the returned handles in its slots. Tests substitute a recording fake.
 */
class EngineServices {
public:
    virtual ~EngineServices() = default;

    virtual Task startHostMonitor(const HostConnection& host) = 0;
    // Log events carry session so a reopened view can drop what an earlier one queued
    virtual Task startLogTail(const HostConnection& host, const ContainerKey& key, LogSessionId session) = 0;
    virtual Task fetchOlderLogs(const HostConnection& host, const ContainerKey& key, LogSessionId session,
                                const LogPageRequest& request) = 0;

    // Fire and forget; results come back as Action* events
    virtual void executeAction(const HostConnection& host, const ContainerKey& key,
                               ContainerAction action) = 0;

    virtual void openUrl(const std::string& url) = 0;
};

/**
 * @brief Services backed by real Docker clients, reporting through the channel
 */
class RuntimeServices : public EngineServices {
public:
    /**
     * @param url_opener Command run with the URL as its only argument
     */
    RuntimeServices(EventSender sender, size_t log_batch_size, std::string url_opener = defaultUrlOpener());

    static std::string defaultUrlOpener();

    Task startHostMonitor(const HostConnection& host) override;
    Task startLogTail(const HostConnection& host, const ContainerKey& key, LogSessionId session) override;
    Task fetchOlderLogs(const HostConnection& host, const ContainerKey& key, LogSessionId session,
                        const LogPageRequest& request) override;
    void executeAction(const HostConnection& host, const ContainerKey& key,
                       ContainerAction action) override;
    void openUrl(const std::string& url) override;

    size_t pendingTasks() const
    {
        return actions_.size();
    }

private:
    // Keeps fire-and-forget tasks, dropping the ones that have finished
    void track(Task task);

    EventSender sender_;
    size_t log_batch_size_;
    std::string url_opener_;
    std::vector<Task> actions_;
};

} // namespace engine
} // namespace dtop
