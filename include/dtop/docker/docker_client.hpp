#pragma once

#include <chrono>
#include <cstdint>
#include <dtop/core/types.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dtop {
namespace docker {

/**
 * @brief Row of GET /containers/json
 */
struct ContainerSummary {
    std::string id;
    std::vector<std::string> names;
    std::string state;
    std::string status;
    std::optional<int64_t> created; // unix seconds
};

/**
 * @brief Subset of GET /containers/{id}/json the dashboard uses
 */
struct ContainerDetail {
    std::string id;
    std::string name;
    std::string state;
    std::optional<std::string> health;
    std::optional<Timestamp> created;
    bool tty = false;
};

/**
 * @brief One message of GET /events
 */
struct DaemonEvent {
    std::string type;
    std::string action;
    std::string actor_id;
    std::map<std::string, std::string> attributes;
};

struct EventFilter {
    std::vector<std::string> types;
    std::vector<std::string> actions;
};

/**
 * @brief Raw counters of one GET /containers/{id}/stats sample
 */
struct StatsSample {
    Timestamp read;
    uint64_t cpu_total = 0;
    uint64_t system_cpu = 0;
    uint64_t precpu_total = 0;
    uint64_t presystem_cpu = 0;
    uint32_t online_cpus = 0;
    uint64_t memory_usage = 0;
    uint64_t memory_cache = 0;
    uint64_t memory_limit = 0;
    uint64_t rx_bytes = 0;
    uint64_t tx_bytes = 0;
};

struct LogOptions {
    bool follow = false;
    bool stdout_stream = true;
    bool stderr_stream = true;
    bool timestamps = true;
    std::optional<size_t> tail;
    std::optional<Timestamp> since;
    std::optional<Timestamp> until;
};

/**
 * @brief Pull-based daemon stream
 *
 * next() blocks for the next item, returns nullopt at end of stream or after
 * cancel(), and throws DtopError(STREAM_ERROR) on transport failure.
 * cancel() may be called from any thread.
 */
template <typename T>
class Stream {
public:
    virtual ~Stream() = default;
    virtual std::optional<T> next() = 0;
    virtual void cancel() = 0;
};

using EventStream = Stream<DaemonEvent>;
using StatsStream = Stream<StatsSample>;
using LogStream = Stream<std::string>;

/**
 * @brief Operations the engine needs from a Docker daemon
 *
 * Every call throws DtopError on failure. Implementations must be safe to
 * call from several threads at once.
 */
class DockerClient {
public:
    virtual ~DockerClient() = default;

    virtual void ping(std::chrono::milliseconds timeout) = 0;
    virtual std::vector<ContainerSummary> listContainers(bool all) = 0;
    virtual ContainerDetail inspectContainer(const std::string& id) = 0;

    virtual std::unique_ptr<EventStream> subscribeEvents(const EventFilter& filter) = 0;
    virtual std::unique_ptr<StatsStream> streamStats(const std::string& id) = 0;
    virtual std::unique_ptr<LogStream> streamLogs(const std::string& id,
                                                  const LogOptions& options) = 0;

    virtual void startContainer(const std::string& id) = 0;
    virtual void stopContainer(const std::string& id, std::chrono::seconds grace) = 0;
    virtual void restartContainer(const std::string& id, std::chrono::seconds grace) = 0;
    virtual void removeContainer(const std::string& id, bool force, bool remove_volumes) = 0;
};

} // namespace docker
} // namespace dtop
