#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace dtop {

using Timestamp = std::chrono::system_clock::time_point;

/// Identifies a connected Docker daemon ("local", or the host part of its URL)
using HostId = std::string;

/// Docker truncates ids to this many characters for display
constexpr size_t SHORT_ID_LENGTH = 12;

enum class ContainerState { Running, Paused, Restarting, Removing, Exited, Dead, Created, Unknown };

enum class HealthStatus { Healthy, Unhealthy, Starting };

/**
 * @brief Case-insensitive parse of a Docker state string ("running", "Exited (0) 2 hours ago")
 */
ContainerState parseContainerState(const std::string& text);

/**
 * @brief Parse a health string; nullopt when the text carries no health status
 *
 * Accepts bare values ("healthy") and list status strings ("Up 3 minutes (unhealthy)").
 */
std::optional<HealthStatus> parseHealthStatus(const std::string& text);

const char* toString(ContainerState state);
const char* toString(HealthStatus health);

std::string shortId(const std::string& id);

/**
 * @brief Runtime statistics, replaced wholesale on every stat tick
 */
struct ContainerStats {
    double cpu = 0.0;
    double memory = 0.0;
    double network_tx_bytes_per_sec = 0.0;
    double network_rx_bytes_per_sec = 0.0;
};

struct ContainerKey {
    HostId host_id;
    std::string container_id;

    ContainerKey() = default;
    ContainerKey(HostId host, std::string id) : host_id(std::move(host)), container_id(std::move(id))
    {}

    bool operator==(const ContainerKey& other) const
    {
        return host_id == other.host_id && container_id == other.container_id;
    }
    bool operator!=(const ContainerKey& other) const
    {
        return !(*this == other);
    }
};

struct ContainerKeyHash {
    size_t operator()(const ContainerKey& key) const noexcept
    {
        size_t h1 = std::hash<std::string>{}(key.host_id);
        size_t h2 = std::hash<std::string>{}(key.container_id);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

struct Container {
    std::string id;
    std::string name;
    ContainerState state = ContainerState::Unknown;
    std::optional<HealthStatus> health; // absent without a health check
    std::optional<Timestamp> created;
    ContainerStats stats;
    HostId host_id;
    std::optional<std::string> viewer_url;

    ContainerKey key() const
    {
        return ContainerKey(host_id, id);
    }
};

enum class ContainerAction { Start, Stop, Restart, Remove };

const char* toString(ContainerAction action);

/**
 * @brief Actions offered in the menu for a container in the given state
 */
std::vector<ContainerAction> availableActions(ContainerState state);

enum class SortField { Uptime, Name, Cpu, Memory };
enum class SortDirection { Ascending, Descending };

SortField nextSortField(SortField field);
SortDirection defaultDirection(SortField field);
SortDirection toggled(SortDirection direction);
const char* toString(SortField field);

struct SortState {
    SortField field = SortField::Uptime;
    SortDirection direction = SortDirection::Descending;

    SortState() = default;
    explicit SortState(SortField f) : field(f), direction(defaultDirection(f)) {}

    bool operator==(const SortState& other) const
    {
        return field == other.field && direction == other.direction;
    }
};

struct LogEntry {
    Timestamp timestamp;
    std::string text;
};

// Identifies one opening of the log view; events from earlier openings are stale
using LogSessionId = uint64_t;

/**
 * @brief Formats an uptime for the container table ("3d 4h", "12m", "N/A")
 */
std::string formatUptime(const std::optional<Timestamp>& created, ContainerState state,
                         Timestamp now = std::chrono::system_clock::now());

} // namespace dtop
