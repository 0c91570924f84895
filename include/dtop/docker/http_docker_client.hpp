#pragma once

#include <chrono>
#include <dtop/docker/curl.hpp>
#include <dtop/docker/docker_client.hpp>
#include <dtop/docker/host_spec.hpp>
#include <dtop/docker/transport.hpp>
#include <filesystem>
#include <memory>
#include <string>

namespace dtop {
namespace docker {

/**
 * @brief DockerClient speaking the Engine REST API through libcurl
 *
 * Every request is its own transfer on a fresh connection, so one client can
 * serve many threads.
 */
class HttpDockerClient : public DockerClient {
public:
    explicit HttpDockerClient(Endpoint endpoint);

    void ping(std::chrono::milliseconds timeout) override;
    std::vector<ContainerSummary> listContainers(bool all) override;
    ContainerDetail inspectContainer(const std::string& id) override;

    std::unique_ptr<EventStream> subscribeEvents(const EventFilter& filter) override;
    std::unique_ptr<StatsStream> streamStats(const std::string& id) override;
    std::unique_ptr<LogStream> streamLogs(const std::string& id, const LogOptions& options) override;

    void startContainer(const std::string& id) override;
    void stopContainer(const std::string& id, std::chrono::seconds grace) override;
    void restartContainer(const std::string& id, std::chrono::seconds grace) override;
    void removeContainer(const std::string& id, bool force, bool remove_volumes) override;

    const Endpoint& endpoint() const
    {
        return endpoint_;
    }

    static std::string eventsTarget(const EventFilter& filter);
    static std::string logsTarget(const std::string& id, const LogOptions& options);

private:
    std::unique_ptr<CurlTransfer> open(const std::string& method, const std::string& target,
                                       std::chrono::milliseconds timeout);
    std::string call(const std::string& method, const std::string& target, ErrorCode failure_code);

    Endpoint endpoint_;
};

struct ClientOptions {
    std::chrono::milliseconds connect_timeout = DEFAULT_CONNECT_TIMEOUT;
    // Holds ca.pem, cert.pem and key.pem for tls:// hosts
    std::filesystem::path cert_path;
};

/**
 * @brief How to reach the daemon a host spec names
 *
 * local and unix:// go through the socket, ssh:// through
 * `docker system dial-stdio` on the remote side, tcp:// over plain HTTP and
 * tls:// over HTTPS with the client certificate from options.cert_path.
 */
Endpoint endpointFor(const HostSpec& spec, const ClientOptions& options);

/**
 * @brief Build a client for a host
 * @throws DtopError(CONNECTION_FAILED) when a tls:// host's certificate files are missing
 */
std::shared_ptr<HttpDockerClient> makeDockerClient(const HostSpec& spec, const ClientOptions& options = ClientOptions());

} // namespace docker
} // namespace dtop
