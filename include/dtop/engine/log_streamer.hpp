#pragma once

#include <cstddef>
#include <dtop/core/event.hpp>
#include <dtop/core/task.hpp>
#include <dtop/docker/docker_client.hpp>
#include <dtop/engine/services.hpp>
#include <vector>

namespace dtop {
namespace engine {

constexpr size_t DEFAULT_LOG_BATCH_SIZE = 1000;

/**
 * @brief Drain a finite log stream into parsed entries
 *
 * Lines without a valid timestamp are dropped. Cancelling the token shuts the
 * stream down and returns what was read so far.
 */
std::vector<LogEntry> readLogEntries(docker::DockerClient& client, const std::string& container_id,
                                     const docker::LogOptions& options, CancelToken& token);

/**
 * @brief Live tail of one container's log
 *
 * Sends the last batch_size lines as one LogBatchPrepend (has_more_history
 * when the batch came back full), then follows the log from just after the
 * newest of those lines, sending one LogLine per new line. Ends on
 * cancellation, end of stream, stream error or a closed channel.
 */
void runLogTail(const HostConnection& host, const ContainerKey& key, LogSessionId session,
                EventSender sender, size_t batch_size, CancelToken& token);

/**
 * @brief One backward pagination request; always answers with a LogBatchPrepend
 * unless cancelled
 */
void runOlderLogsFetch(const HostConnection& host, const ContainerKey& key, LogSessionId session,
                       const LogPageRequest& request, EventSender sender, CancelToken& token);

} // namespace engine
} // namespace dtop
