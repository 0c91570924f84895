#include <dtop/core/error.hpp>
#include <dtop/core/logger.hpp>
#include <dtop/engine/host_connector.hpp>

namespace dtop {
namespace engine {

HostConnection connectHost(const HostEntry& entry, const ClientFactory& factory,
                           std::chrono::milliseconds ping_timeout)
{
    docker::HostSpec spec = docker::parseHostSpec(entry.spec);
    std::shared_ptr<docker::DockerClient> client = factory(spec);
    client->ping(ping_timeout);
    return HostConnection{spec.host_id, std::move(client), entry.viewer_url};
}

HostConnector::HostConnector(std::vector<HostEntry> hosts, EventSender sender, ClientFactory factory,
                             std::chrono::milliseconds ping_timeout)
    : hosts_(std::move(hosts)),
      sender_(std::move(sender)),
      factory_(std::move(factory)),
      ping_timeout_(ping_timeout),
      progress_(std::make_shared<Progress>())
{}

void HostConnector::start()
{
    {
        std::lock_guard<std::mutex> lock(progress_->mutex);
        progress_->pending = hosts_.size();
    }

    for (const auto& entry : hosts_) {
        auto progress = progress_;
        EventSender sender = sender_;
        ClientFactory factory = factory_;
        auto ping_timeout = ping_timeout_;

        probes_.push_back(Task::spawn("connect:" + entry.spec, [entry, progress, sender, factory,
                                                                 ping_timeout](CancelToken&) mutable {
            auto* logger = Logger::getInstance();
            try {
                HostConnection host = connectHost(entry, factory, ping_timeout);
                logger->info("Connected to {} ({})", host.host_id, entry.spec);

                HostId host_id = host.host_id;
                if (!sender.send(events::HostConnected{std::move(host)})) {
                    logger->debug("Event channel closed before {} was registered", host_id);
                }

                std::lock_guard<std::mutex> lock(progress->mutex);
                --progress->pending;
                if (!progress->first) {
                    progress->first = host_id;
                }
            }
            catch (const DtopError& e) {
                logger->error("Connecting to {} failed: {}", entry.spec, e.what());

                HostId host_id = entry.spec;
                try {
                    host_id = docker::parseHostSpec(entry.spec).host_id;
                }
                catch (const DtopError&) {
                    // Unparseable specs are reported under their raw text
                }
                if (!sender.send(events::ConnectionError{host_id, e.detail()})) {
                    logger->debug("Event channel closed before the {} failure was reported", host_id);
                }

                std::lock_guard<std::mutex> lock(progress->mutex);
                --progress->pending;
                progress->failures.push_back(entry.spec + ": " + e.detail());
            }
            progress->changed.notify_all();
        }));
    }
}

HostId HostConnector::waitForFirst(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(progress_->mutex);
    bool settled = progress_->changed.wait_for(
        lock, timeout, [this] { return progress_->first.has_value() || progress_->pending == 0; });

    if (progress_->first) {
        return *progress_->first;
    }

    if (!settled) {
        throw DtopError(ErrorCode::NO_HOSTS_CONNECTED,
                        "no host answered within " +
                            std::to_string(std::chrono::duration_cast<std::chrono::seconds>(timeout).count()) +
                            "s");
    }

    std::string message = "could not connect to any host";
    for (const auto& failure : progress_->failures) {
        message += "\n  " + failure;
    }
    throw DtopError(ErrorCode::NO_HOSTS_CONNECTED, message);
}

} // namespace engine
} // namespace dtop
