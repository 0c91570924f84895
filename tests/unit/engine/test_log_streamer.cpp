#include <gtest/gtest.h>
#include <cstdio>
#include <dtop/engine/log_streamer.hpp>
#include <fakes/fake_docker_client.hpp>
#include <memory>
#include <string>
#include <vector>

using namespace dtop;
using namespace dtop::engine;
using namespace std::chrono_literals;

namespace {

const Timestamp BASE = Timestamp(std::chrono::seconds(1700000000));
constexpr LogSessionId SESSION = 7;

Timestamp at(int seconds)
{
    return BASE + std::chrono::seconds(seconds);
}

// Timestamped log line `seconds` after 2023-11-14T22:13:20Z (seconds < 40)
std::string line(int seconds, const std::string& text)
{
    char stamp[40];
    std::snprintf(stamp, sizeof(stamp), "2023-11-14T22:13:%02dZ", 20 + seconds);
    return std::string(stamp) + " " + text + "\n";
}

std::unique_ptr<docker::LogStream> streamOf(std::vector<std::string> lines)
{
    return std::make_unique<fakes::FakeStream<std::string>>(std::move(lines));
}

} // namespace

class LogStreamerTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        client = std::make_shared<fakes::FakeDockerClient>();
        host = HostConnection{"local", client, std::nullopt};
        auto channel = makeEventChannel(64);
        sender = std::make_unique<EventSender>(std::move(channel.first));
        receiver = std::make_unique<EventReceiver>(std::move(channel.second));
    }

    std::vector<AppEvent> drain()
    {
        std::vector<AppEvent> events;
        AppEvent event;
        while (receiver->tryRecv(event)) {
            events.push_back(std::move(event));
        }
        return events;
    }

    const ContainerKey key{"local", "abc123"};
    std::shared_ptr<fakes::FakeDockerClient> client;
    HostConnection host;
    std::unique_ptr<EventSender> sender;
    std::unique_ptr<EventReceiver> receiver;
    CancelToken token;
};

TEST_F(LogStreamerTest, ReadLogEntriesDropsLinesWithoutTimestamp)
{
    client->logs_handler = [](const std::string&, const docker::LogOptions&) {
        return streamOf({line(0, "first"), "garbage without a timestamp\n", line(1, "\x1b[31msecond\x1b[0m")});
    };

    auto entries = readLogEntries(*client, "abc123", docker::LogOptions(), token);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].timestamp, at(0));
    EXPECT_EQ(entries[0].text, "first");
    EXPECT_EQ(entries[1].text, "second");
}

TEST_F(LogStreamerTest, TailSendsHistoryThenFollowsAfterNewestLine)
{
    client->logs_handler = [](const std::string&, const docker::LogOptions& options) {
        if (!options.follow) {
            return streamOf({line(0, "a"), line(1, "b"), line(2, "c")});
        }
        // since= is whole seconds, so the newest history line comes back again
        return streamOf({line(2, "c"), line(3, "d"), "not a log line\n", line(4, "e")});
    };

    runLogTail(host, key, SESSION, *sender, 3, token);

    auto events = drain();
    ASSERT_EQ(events.size(), 3u);

    const auto* batch = std::get_if<events::LogBatchPrepend>(&events[0]);
    ASSERT_NE(batch, nullptr);
    EXPECT_EQ(batch->key, key);
    EXPECT_EQ(batch->session, SESSION);
    EXPECT_EQ(batch->entries.size(), 3u);
    EXPECT_TRUE(batch->has_more_history);

    const auto* first = std::get_if<events::LogLine>(&events[1]);
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first->entry.text, "d");
    EXPECT_EQ(first->session, SESSION);
    EXPECT_EQ(std::get<events::LogLine>(events[2]).entry.text, "e");

    auto requests = client->logRequests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_FALSE(requests[0].follow);
    EXPECT_EQ(requests[0].tail, 3u);
    EXPECT_TRUE(requests[1].follow);
    EXPECT_EQ(requests[1].since, at(2));
    EXPECT_FALSE(requests[1].tail.has_value());
}

TEST_F(LogStreamerTest, ShortHistoryHasNoMore)
{
    client->logs_handler = [](const std::string&, const docker::LogOptions& options) {
        if (!options.follow) {
            return streamOf({line(0, "only")});
        }
        return streamOf({});
    };

    runLogTail(host, key, SESSION, *sender, 1000, token);

    auto events = drain();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_FALSE(std::get<events::LogBatchPrepend>(events[0]).has_more_history);
}

TEST_F(LogStreamerTest, EmptyHistoryFollowsFromNow)
{
    client->logs_handler = [](const std::string&, const docker::LogOptions& options) {
        if (!options.follow) {
            return streamOf({});
        }
        return streamOf({line(5, "fresh")});
    };

    runLogTail(host, key, SESSION, *sender, 1000, token);

    auto events = drain();
    ASSERT_EQ(events.size(), 2u);
    const auto& batch = std::get<events::LogBatchPrepend>(events[0]);
    EXPECT_TRUE(batch.entries.empty());
    EXPECT_FALSE(batch.has_more_history);
    EXPECT_EQ(std::get<events::LogLine>(events[1]).entry.text, "fresh");

    auto requests = client->logRequests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[1].tail, 0u);
    EXPECT_FALSE(requests[1].since.has_value());
}

TEST_F(LogStreamerTest, TailStopsWhenReceiverCloses)
{
    receiver->close();
    client->logs_handler = [](const std::string&, const docker::LogOptions&) {
        return streamOf({line(0, "a")});
    };

    runLogTail(host, key, SESSION, *sender, 1000, token);
    EXPECT_EQ(client->logRequests().size(), 1u);
}

TEST_F(LogStreamerTest, TailEndsQuietlyOnStreamError)
{
    client->logs_handler = [](const std::string&, const docker::LogOptions&) {
        return std::unique_ptr<docker::LogStream>(std::make_unique<fakes::FakeStream<std::string>>(
            std::vector<std::string>{line(0, "a")}, false,
            DtopError(ErrorCode::STREAM_ERROR, "connection reset")));
    };

    EXPECT_NO_THROW(runLogTail(host, key, SESSION, *sender, 1000, token));
    EXPECT_TRUE(drain().empty());
}

TEST_F(LogStreamerTest, CancellingTokenStopsFollow)
{
    auto follow = std::make_shared<fakes::FakeStream<std::string>>(std::vector<std::string>{}, true);
    client->logs_handler = [follow](const std::string&, const docker::LogOptions& options)
        -> std::unique_ptr<docker::LogStream> {
        if (!options.follow) {
            return streamOf({line(0, "a")});
        }
        return std::make_unique<fakes::SharedStream<std::string>>(follow);
    };

    EventSender task_sender = *sender;
    auto client_host = host;
    Task task = Task::spawn("tail", [client_host, this, task_sender](CancelToken& t) {
        runLogTail(client_host, key, SESSION, task_sender, 1000, t);
    });

    AppEvent event;
    ASSERT_EQ(receiver->recvTimeout(2s, event), RecvStatus::Event);
    follow->push(line(1, "live"));
    ASSERT_EQ(receiver->recvTimeout(2s, event), RecvStatus::Event);
    EXPECT_EQ(std::get<events::LogLine>(event).entry.text, "live");

    task.cancel();
    task.join();
    EXPECT_TRUE(task.isFinished());
}

TEST_F(LogStreamerTest, OlderFetchSendsMostRecentPage)
{
    client->logs_handler = [](const std::string&, const docker::LogOptions& options) {
        std::vector<std::string> lines;
        for (int s = 0; s < 30; ++s) {
            Timestamp t = at(s);
            if ((!options.since || t >= *options.since) && (!options.until || t <= *options.until)) {
                lines.push_back(line(s, "old " + std::to_string(s)));
            }
        }
        return streamOf(lines);
    };

    LogPageRequest request;
    request.oldest_loaded = at(30);
    request.batch_oldest = at(30);
    request.batch_newest = at(39);
    request.created = at(0);
    request.batch_size = 5;

    runOlderLogsFetch(host, key, SESSION, request, *sender, token);

    auto events = drain();
    ASSERT_EQ(events.size(), 1u);
    const auto& page = std::get<events::LogBatchPrepend>(events[0]);
    EXPECT_EQ(page.session, SESSION);
    EXPECT_TRUE(page.has_more_history);
    ASSERT_EQ(page.entries.size(), 5u);
    EXPECT_EQ(page.entries.front().timestamp, at(25));
    EXPECT_EQ(page.entries.back().timestamp, at(29));

    auto requests = client->logRequests();
    ASSERT_FALSE(requests.empty());
    EXPECT_FALSE(requests[0].follow);
    EXPECT_EQ(requests[0].until, at(30));
}

TEST_F(LogStreamerTest, OlderFetchErrorStillReleasesGuard)
{
    client->logs_handler = [](const std::string&, const docker::LogOptions&) -> std::unique_ptr<docker::LogStream> {
        throw DtopError(ErrorCode::API_ERROR, "daemon unavailable");
    };

    LogPageRequest request;
    request.oldest_loaded = at(30);
    request.batch_oldest = at(30);
    request.batch_newest = at(39);

    runOlderLogsFetch(host, key, SESSION, request, *sender, token);

    auto events = drain();
    ASSERT_EQ(events.size(), 1u);
    const auto& page = std::get<events::LogBatchPrepend>(events[0]);
    EXPECT_TRUE(page.entries.empty());
    EXPECT_TRUE(page.has_more_history);
}

TEST_F(LogStreamerTest, CancelledOlderFetchSendsNothing)
{
    token.cancel();
    LogPageRequest request;
    request.oldest_loaded = at(30);
    request.batch_oldest = at(30);
    request.batch_newest = at(39);

    runOlderLogsFetch(host, key, SESSION, request, *sender, token);
    EXPECT_TRUE(drain().empty());
    EXPECT_TRUE(client->logRequests().empty());
}
