#pragma once

#include <chrono>
#include <dtop/core/event.hpp>
#include <dtop/core/task.hpp>
#include <dtop/docker/docker_client.hpp>
#include <string>

namespace dtop {
namespace engine {

constexpr std::chrono::milliseconds EVENT_STREAM_RETRY_DELAY{1000};

/**
 * @brief Keeps one host's containers in sync with its daemon
 *
 * run() lists every container, sends an InitialContainerList, starts a stat
 * task per running container, then follows the daemon's start / die / stop /
 * health_status events until cancelled. A failing event stream is reopened
 * after a short pause. The monitor owns its stat tasks; they are cancelled
 * when it is destroyed.
 */
class ContainerMonitor {
public:
    ContainerMonitor(HostConnection host, EventSender sender,
                     std::chrono::milliseconds retry_delay = EVENT_STREAM_RETRY_DELAY);

    ContainerMonitor(const ContainerMonitor&) = delete;
    ContainerMonitor& operator=(const ContainerMonitor&) = delete;

    void run(CancelToken& token);

    void loadInitialContainers();

    /**
     * @brief Apply one daemon event
     * @return false once the event channel is closed
     */
    bool handleDaemonEvent(const docker::DaemonEvent& event);

    bool hasStatTask(const std::string& container_id) const
    {
        return stat_tasks_.isActive(container_id);
    }
    size_t statTaskCount() const
    {
        return stat_tasks_.size();
    }

    static docker::EventFilter lifecycleFilter();

private:
    void startStatTask(const std::string& container_id);
    void stopStatTask(const std::string& container_id);
    bool handleStart(const std::string& container_id);
    bool handleHealthStatus(const std::string& container_id, const docker::DaemonEvent& event);

    HostConnection host_;
    EventSender sender_;
    std::chrono::milliseconds retry_delay_;
    TaskMap<std::string> stat_tasks_;
};

/**
 * @brief Stream a container's stats as ContainerStat events until cancelled
 */
void runStatStream(const HostConnection& host, const ContainerKey& key, EventSender sender,
                   CancelToken& token);

} // namespace engine
} // namespace dtop
