#pragma once

#include <chrono>
#include <dtop/core/task.hpp>
#include <dtop/engine/services.hpp>
#include <memory>
#include <string>
#include <vector>

namespace dtop {
namespace fakes {

/**
 * @brief EngineServices that spawns idle tasks and records every request
 *
 * Each spawned task sleeps until cancelled, so a test can tell from the
 * recorded tokens which tasks the state machine still holds.
 */
class FakeServices : public engine::EngineServices {
public:
    struct Spawned {
        HostId host_id;
        ContainerKey key;
        std::shared_ptr<CancelToken> token;
        LogSessionId session = 0;
    };

    struct FetchRequest {
        ContainerKey key;
        engine::LogPageRequest request;
        std::shared_ptr<CancelToken> token;
        LogSessionId session = 0;
    };

    struct ActionRequest {
        HostId host_id;
        ContainerKey key;
        ContainerAction action;
    };

    Task startHostMonitor(const HostConnection& host) override
    {
        Task task = idleTask("monitor:" + host.host_id);
        monitors.push_back(Spawned{host.host_id, ContainerKey(), task.token()});
        return task;
    }

    Task startLogTail(const HostConnection& host, const ContainerKey& key, LogSessionId session) override
    {
        Task task = idleTask("logs:" + key.container_id);
        tails.push_back(Spawned{host.host_id, key, task.token(), session});
        return task;
    }

    Task fetchOlderLogs(const HostConnection&, const ContainerKey& key, LogSessionId session,
                        const engine::LogPageRequest& request) override
    {
        Task task = idleTask("older:" + key.container_id);
        fetches.push_back(FetchRequest{key, request, task.token(), session});
        return task;
    }

    void executeAction(const HostConnection& host, const ContainerKey& key, ContainerAction action) override
    {
        actions.push_back(ActionRequest{host.host_id, key, action});
    }

    void openUrl(const std::string& url) override
    {
        opened_urls.push_back(url);
    }

    template <typename T>
    static size_t activeCount(const std::vector<T>& spawned)
    {
        size_t count = 0;
        for (const auto& item : spawned) {
            if (!item.token->isCancelled()) {
                ++count;
            }
        }
        return count;
    }

    std::vector<Spawned> monitors;
    std::vector<Spawned> tails;
    std::vector<FetchRequest> fetches;
    std::vector<ActionRequest> actions;
    std::vector<std::string> opened_urls;

private:
    static Task idleTask(std::string name)
    {
        return Task::spawn(std::move(name), [](CancelToken& token) {
            while (token.sleepFor(std::chrono::milliseconds(50))) {
            }
        });
    }
};

} // namespace fakes
} // namespace dtop
