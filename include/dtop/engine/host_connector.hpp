#pragma once

#include <chrono>
#include <condition_variable>
#include <dtop/core/config.hpp>
#include <dtop/core/event.hpp>
#include <dtop/core/task.hpp>
#include <dtop/docker/docker_client.hpp>
#include <dtop/docker/host_spec.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace dtop {
namespace engine {

constexpr std::chrono::seconds DEFAULT_PING_TIMEOUT{10};
constexpr std::chrono::seconds DEFAULT_STARTUP_TIMEOUT{30};

using ClientFactory = std::function<std::shared_ptr<docker::DockerClient>(const docker::HostSpec&)>;

/**
 * @brief Connects to every configured host concurrently
 *
 * Each host is parsed, dialed and pinged on its own task. A success sends
 * HostConnected, a failure sends ConnectionError; neither is fatal on its own.
 */
class HostConnector {
public:
    HostConnector(std::vector<HostEntry> hosts, EventSender sender, ClientFactory factory,
                  std::chrono::milliseconds ping_timeout = DEFAULT_PING_TIMEOUT);

    HostConnector(const HostConnector&) = delete;
    HostConnector& operator=(const HostConnector&) = delete;

    void start();

    /**
     * @brief Block until the first host answers its ping
     * @return the host id of that first host
     * @throws DtopError(NO_HOSTS_CONNECTED) when every host failed or the
     *         timeout passed without a success
     */
    HostId waitForFirst(std::chrono::milliseconds timeout = DEFAULT_STARTUP_TIMEOUT);

private:
    struct Progress {
        std::mutex mutex;
        std::condition_variable changed;
        size_t pending = 0;
        std::optional<HostId> first;
        std::vector<std::string> failures;
    };

    std::vector<HostEntry> hosts_;
    EventSender sender_;
    ClientFactory factory_;
    std::chrono::milliseconds ping_timeout_;
    std::shared_ptr<Progress> progress_;
    std::vector<Task> probes_;
};

/**
 * @brief Probe one host: parse, build the client, ping
 * @throws DtopError on any failure
 */
HostConnection connectHost(const HostEntry& entry, const ClientFactory& factory,
                           std::chrono::milliseconds ping_timeout);

} // namespace engine
} // namespace dtop
