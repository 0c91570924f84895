#pragma once

#include <cstddef>
#include <dtop/core/types.hpp>
#include <dtop/docker/docker_client.hpp>
#include <optional>
#include <string>
#include <vector>

namespace dtop {
namespace docker {

// Docker Engine API payloads; throw DtopError(PARSE_ERROR) on malformed JSON
std::vector<ContainerSummary> parseContainerList(const std::string& body);
ContainerDetail parseContainerDetail(const std::string& body);
DaemonEvent parseDaemonEvent(const std::string& line);
StatsSample parseStatsSample(const std::string& line);

/**
 * @brief Message of a Docker error body ({"message": "..."}), or the body itself
 */
std::string parseErrorMessage(const std::string& body);

/**
 * @brief Parse RFC3339 with optional fractional seconds and zone offset
 */
std::optional<Timestamp> parseRfc3339(const std::string& text);

/**
 * @brief Unix time with nanoseconds ("1700000000.123456789"), as /logs since/until expect
 */
std::string formatUnixTimestamp(Timestamp timestamp);

/**
 * @brief Parse "<RFC3339Nano> <message>"; nullopt for lines without a valid timestamp
 *
 * Carriage returns and ANSI escape sequences are removed from the message.
 */
std::optional<LogEntry> parseLogLine(const std::string& line);

std::string stripAnsi(const std::string& text);

Container toContainer(const ContainerSummary& summary, const HostId& host_id,
                      const std::optional<std::string>& viewer_url);
Container toContainer(const ContainerDetail& detail, const HostId& host_id,
                      const std::optional<std::string>& viewer_url);

/**
 * @brief Health from an event's actor attributes ("health_status" or "HealthStatus")
 */
std::optional<HealthStatus> healthFromAttributes(const DaemonEvent& event);

/**
 * @brief Splits a byte stream into newline-terminated lines
 */
class LineSplitter {
public:
    void feed(const std::string& data, std::vector<std::string>& lines);

    // Remaining partial line, if any, once the stream has ended
    std::optional<std::string> finish();

private:
    std::string pending_;
};

/**
 * @brief Demultiplexes /logs output into lines
 *
 * Non-TTY containers send 8-byte framed stdout/stderr records; TTY containers
 * send raw text. The format is detected from the first bytes.
 */
class LogFrameDecoder {
public:
    void feed(const std::string& data, std::vector<std::string>& lines);

    // Flush whatever is buffered once the stream has ended
    void finish(std::vector<std::string>& lines);

private:
    enum class Mode { Detect, Framed, Raw };

    Mode mode_ = Mode::Detect;
    std::string buffer_;
    LineSplitter splitter_;
};

/**
 * @brief Turns raw stats samples into dashboard percentages and rates
 *
 * cpu % = container cpu delta / system cpu delta * online cpus * 100,
 * memory % = (usage - cache) / limit * 100, network rates from the
 * previous sample's counters.
 */
class StatsCalculator {
public:
    ContainerStats update(const StatsSample& sample);

private:
    std::optional<StatsSample> previous_;
};

} // namespace docker
} // namespace dtop
