#include <dtop/core/error.hpp>
#include <dtop/core/logger.hpp>
#include <dtop/docker/parsers.hpp>
#include <dtop/engine/log_paginator.hpp>
#include <dtop/engine/log_streamer.hpp>
#include <memory>

namespace dtop {
namespace engine {

namespace {

std::shared_ptr<docker::LogStream> openLogStream(docker::DockerClient& client, const std::string& container_id,
                                                 const docker::LogOptions& options)
{
    return std::shared_ptr<docker::LogStream>(client.streamLogs(container_id, options));
}

} // namespace

std::vector<LogEntry> readLogEntries(docker::DockerClient& client, const std::string& container_id,
                                     const docker::LogOptions& options, CancelToken& token)
{
    auto stream = openLogStream(client, container_id, options);
    CancelHookGuard guard(token, [stream]() { stream->cancel(); });

    std::vector<LogEntry> entries;
    while (auto line = stream->next()) {
        if (auto entry = docker::parseLogLine(*line)) {
            entries.push_back(std::move(*entry));
        }
    }
    return entries;
}

void runLogTail(const HostConnection& host, const ContainerKey& key, LogSessionId session,
                EventSender sender, size_t batch_size, CancelToken& token)
{
    auto* logger = Logger::getInstance();
    logger->debug("Log tail started for {}/{}", key.host_id, key.container_id);

    try {
        docker::LogOptions initial;
        initial.tail = batch_size;
        std::vector<LogEntry> history = readLogEntries(*host.client, key.container_id, initial, token);
        if (token.isCancelled()) {
            return;
        }

        std::optional<Timestamp> last;
        if (!history.empty()) {
            last = history.back().timestamp;
        }
        bool has_more = history.size() >= batch_size;
        if (!sender.send(events::LogBatchPrepend{key, std::move(history), has_more, session})) {
            return;
        }

        docker::LogOptions follow;
        follow.follow = true;
        if (last) {
            follow.since = *last;
        }
        else {
            follow.tail = 0;
        }

        auto stream = std::shared_ptr<docker::LogStream>(host.client->streamLogs(key.container_id, follow));
        CancelHookGuard guard(token, [stream]() { stream->cancel(); });

        while (auto line = stream->next()) {
            auto entry = docker::parseLogLine(*line);
            if (!entry) {
                continue;
            }
            // since= has second granularity; skip what the history batch already holds
            if (last && entry->timestamp <= *last) {
                continue;
            }
            if (!sender.send(events::LogLine{key, std::move(*entry), session})) {
                return;
            }
        }
    }
    catch (const DtopError& e) {
        if (!token.isCancelled()) {
            logger->warning("Log stream for {}/{} ended: {}", key.host_id, key.container_id, e.what());
        }
    }

    logger->debug("Log tail finished for {}/{}", key.host_id, key.container_id);
}

void runOlderLogsFetch(const HostConnection& host, const ContainerKey& key, LogSessionId session,
                       const LogPageRequest& request, EventSender sender, CancelToken& token)
{
    auto* logger = Logger::getInstance();

    std::optional<LogPage> page;
    try {
        page = fetchOlderPage(
            request,
            [&](Timestamp since, Timestamp until) {
                docker::LogOptions options;
                options.since = since;
                options.until = until;
                return readLogEntries(*host.client, key.container_id, options, token);
            },
            &token);
    }
    catch (const DtopError& e) {
        logger->warning("Fetching older logs for {}/{} failed: {}", key.host_id, key.container_id, e.what());
        // Releases the fetching guard; history stays marked as available for a retry
        page = LogPage{{}, true};
    }

    if (!page || token.isCancelled()) {
        return;
    }
    if (!sender.send(events::LogBatchPrepend{key, std::move(page->entries), page->has_more_history, session})) {
        logger->debug("Dropping older log page for {}/{}: channel closed", key.host_id, key.container_id);
    }
}

} // namespace engine
} // namespace dtop
