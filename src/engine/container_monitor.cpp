#include <dtop/core/error.hpp>
#include <dtop/core/logger.hpp>
#include <dtop/docker/parsers.hpp>
#include <dtop/engine/container_monitor.hpp>
#include <memory>

namespace dtop {
namespace engine {

ContainerMonitor::ContainerMonitor(HostConnection host, EventSender sender,
                                   std::chrono::milliseconds retry_delay)
    : host_(std::move(host)), sender_(std::move(sender)), retry_delay_(retry_delay)
{}

docker::EventFilter ContainerMonitor::lifecycleFilter()
{
    docker::EventFilter filter;
    filter.types = {"container"};
    filter.actions = {"start", "die", "stop", "health_status"};
    return filter;
}

void ContainerMonitor::run(CancelToken& token)
{
    auto* logger = Logger::getInstance();
    logger->info("Monitoring containers on {}", host_.host_id);

    try {
        loadInitialContainers();
    }
    catch (const DtopError& e) {
        logger->error("Listing containers on {} failed: {}", host_.host_id, e.what());
        if (!sender_.send(events::ConnectionError{host_.host_id, e.detail()})) {
            return;
        }
    }

    while (!token.isCancelled() && sender_.isConnected()) {
        try {
            auto stream = std::shared_ptr<docker::EventStream>(host_.client->subscribeEvents(lifecycleFilter()));
            CancelHookGuard guard(token, [stream]() { stream->cancel(); });

            while (auto event = stream->next()) {
                if (!handleDaemonEvent(*event)) {
                    stat_tasks_.cancelAll();
                    return;
                }
            }

            if (token.isCancelled()) {
                break;
            }
            logger->debug("Event stream on {} closed, resubscribing", host_.host_id);
        }
        catch (const DtopError& e) {
            if (token.isCancelled()) {
                break;
            }
            logger->warning("Event stream on {} failed: {}", host_.host_id, e.what());
        }

        if (!token.sleepFor(retry_delay_)) {
            break;
        }
    }

    stat_tasks_.cancelAll();
    logger->info("Stopped monitoring {}", host_.host_id);
}

void ContainerMonitor::loadInitialContainers()
{
    std::vector<docker::ContainerSummary> summaries = host_.client->listContainers(true);

    std::vector<Container> containers;
    containers.reserve(summaries.size());
    for (const auto& summary : summaries) {
        containers.push_back(docker::toContainer(summary, host_.host_id, host_.viewer_url));
    }

    std::vector<std::string> running;
    for (const auto& container : containers) {
        if (container.state == ContainerState::Running) {
            running.push_back(container.id);
        }
    }

    Logger::getInstance()->info("{} containers on {} ({} running)", containers.size(), host_.host_id,
                                running.size());
    if (!sender_.send(events::InitialContainerList{host_.host_id, std::move(containers)})) {
        return;
    }

    for (const auto& id : running) {
        startStatTask(id);
    }
}

bool ContainerMonitor::handleDaemonEvent(const docker::DaemonEvent& event)
{
    if (event.actor_id.empty()) {
        return true;
    }
    std::string id = shortId(event.actor_id);

    try {
        if (event.action == "start") {
            return handleStart(id);
        }
        if (event.action == "die" || event.action == "stop") {
            // Cancel first so the task cannot report stats for a removed row
            stopStatTask(id);
            return sender_.send(events::ContainerDestroyed{ContainerKey(host_.host_id, id)});
        }
        if (event.action.rfind("health_status", 0) == 0) {
            return handleHealthStatus(id, event);
        }
    }
    catch (const DtopError& e) {
        Logger::getInstance()->warning("Handling {} for {}/{} failed: {}", event.action, host_.host_id, id,
                                       e.what());
    }
    return true;
}

bool ContainerMonitor::handleStart(const std::string& container_id)
{
    docker::ContainerDetail detail = host_.client->inspectContainer(container_id);
    Container container = docker::toContainer(detail, host_.host_id, host_.viewer_url);
    if (!sender_.send(events::ContainerCreated{std::move(container)})) {
        return false;
    }
    startStatTask(container_id);
    return true;
}

bool ContainerMonitor::handleHealthStatus(const std::string& container_id, const docker::DaemonEvent& event)
{
    std::optional<HealthStatus> health = docker::healthFromAttributes(event);
    if (!health) {
        docker::ContainerDetail detail = host_.client->inspectContainer(container_id);
        if (detail.health) {
            health = parseHealthStatus(*detail.health);
        }
    }

    if (!health) {
        return true;
    }
    return sender_.send(events::ContainerHealthChanged{ContainerKey(host_.host_id, container_id), *health});
}

void ContainerMonitor::startStatTask(const std::string& container_id)
{
    if (stat_tasks_.isActive(container_id)) {
        return;
    }

    ContainerKey key(host_.host_id, container_id);
    HostConnection host = host_;
    EventSender sender = sender_;
    stat_tasks_.replace(container_id,
                        Task::spawn("stats:" + host_.host_id + "/" + container_id,
                                    [host, key, sender](CancelToken& token) {
                                        runStatStream(host, key, sender, token);
                                    }));
}

void ContainerMonitor::stopStatTask(const std::string& container_id)
{
    stat_tasks_.cancel(container_id);
}

void runStatStream(const HostConnection& host, const ContainerKey& key, EventSender sender,
                   CancelToken& token)
{
    try {
        auto stream = std::shared_ptr<docker::StatsStream>(host.client->streamStats(key.container_id));
        CancelHookGuard guard(token, [stream]() { stream->cancel(); });

        docker::StatsCalculator calculator;
        while (auto sample = stream->next()) {
            if (token.isCancelled()) {
                break;
            }
            if (!sender.send(events::ContainerStat{key, calculator.update(*sample)})) {
                break;
            }
        }
    }
    catch (const DtopError& e) {
        if (!token.isCancelled()) {
            Logger::getInstance()->debug("Stats stream for {}/{} ended: {}", key.host_id, key.container_id,
                                         e.what());
        }
    }
}

} // namespace engine
} // namespace dtop
