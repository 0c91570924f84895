#include <gtest/gtest.h>
#include <dtop/core/error.hpp>
#include <dtop/docker/parsers.hpp>
#include <string>
#include <vector>

using namespace dtop;
using namespace dtop::docker;
using namespace std::chrono_literals;

namespace {

std::string frame(unsigned char stream, const std::string& payload)
{
    std::string header(8, '\0');
    header[0] = static_cast<char>(stream);
    size_t size = payload.size();
    header[4] = static_cast<char>((size >> 24) & 0xff);
    header[5] = static_cast<char>((size >> 16) & 0xff);
    header[6] = static_cast<char>((size >> 8) & 0xff);
    header[7] = static_cast<char>(size & 0xff);
    return header + payload;
}

Timestamp at(int64_t seconds, int64_t nanos = 0)
{
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::seconds(seconds) +
                                                                     std::chrono::nanoseconds(nanos)));
}

} // namespace

class ParsersTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(ParsersTest, ContainerList)
{
    auto list = parseContainerList(R"json([
        {"Id": "4f66ad1f2c3b8e9a", "Names": ["/nginx"], "State": "running",
         "Status": "Up 2 hours (healthy)", "Created": 1700000000},
        {"Id": "9a8b7c6d5e4f", "Names": ["/redis", "/alias"], "State": "exited",
         "Status": "Exited (0) 3 minutes ago"}
    ])json");

    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].names[0], "nginx");
    EXPECT_EQ(list[0].created.value_or(0), 1700000000);
    EXPECT_EQ(list[1].names.size(), 2u);
    EXPECT_FALSE(list[1].created);

    Container nginx = toContainer(list[0], "local", std::string("https://logs"));
    EXPECT_EQ(nginx.id, "4f66ad1f2c3b");
    EXPECT_EQ(nginx.name, "nginx");
    EXPECT_EQ(nginx.state, ContainerState::Running);
    EXPECT_EQ(nginx.health, HealthStatus::Healthy);
    EXPECT_EQ(nginx.created, at(1700000000));
    EXPECT_EQ(nginx.host_id, "local");
    EXPECT_EQ(nginx.viewer_url.value_or(""), "https://logs");

    Container redis = toContainer(list[1], "local", std::nullopt);
    EXPECT_EQ(redis.state, ContainerState::Exited);
    EXPECT_FALSE(redis.health);
}

TEST_F(ParsersTest, ContainerListRejectsNonArray)
{
    EXPECT_THROW(parseContainerList(R"({"message": "nope"})"), DtopError);
    EXPECT_THROW(parseContainerList("not json"), DtopError);
}

TEST_F(ParsersTest, ContainerDetail)
{
    auto detail = parseContainerDetail(R"({
        "Id": "4f66ad1f2c3b8e9a", "Name": "/web",
        "Created": "2023-11-14T22:13:20.5Z",
        "State": {"Status": "running", "Health": {"Status": "starting"}},
        "Config": {"Tty": true}
    })");

    EXPECT_EQ(detail.name, "web");
    EXPECT_EQ(detail.state, "running");
    EXPECT_EQ(detail.health.value_or(""), "starting");
    EXPECT_TRUE(detail.tty);
    EXPECT_EQ(detail.created, at(1700000000, 500000000));

    Container c = toContainer(detail, "prod", std::nullopt);
    EXPECT_EQ(c.id, "4f66ad1f2c3b");
    EXPECT_EQ(c.health, HealthStatus::Starting);
}

TEST_F(ParsersTest, DaemonEvent)
{
    auto event = parseDaemonEvent(R"({
        "Type": "container", "Action": "health_status: unhealthy",
        "Actor": {"ID": "abc123", "Attributes": {"name": "web", "health_status": "unhealthy"}}
    })");

    EXPECT_EQ(event.type, "container");
    EXPECT_EQ(event.action, "health_status: unhealthy");
    EXPECT_EQ(event.actor_id, "abc123");
    EXPECT_EQ(healthFromAttributes(event), HealthStatus::Unhealthy);

    auto legacy = parseDaemonEvent(R"({"status": "die", "id": "def456"})");
    EXPECT_EQ(legacy.action, "die");
    EXPECT_EQ(legacy.actor_id, "def456");
    EXPECT_FALSE(healthFromAttributes(legacy));
}

TEST_F(ParsersTest, StatsSampleAndCalculation)
{
    auto first = parseStatsSample(R"({
        "read": "2023-11-14T22:13:20Z",
        "cpu_stats": {"cpu_usage": {"total_usage": 400}, "system_cpu_usage": 2000, "online_cpus": 2},
        "precpu_stats": {"cpu_usage": {"total_usage": 200}, "system_cpu_usage": 1000},
        "memory_stats": {"usage": 600, "limit": 1000, "stats": {"inactive_file": 100}},
        "networks": {"eth0": {"rx_bytes": 1000, "tx_bytes": 500}, "eth1": {"rx_bytes": 24, "tx_bytes": 12}}
    })");

    EXPECT_EQ(first.online_cpus, 2u);
    EXPECT_EQ(first.memory_cache, 100u);
    EXPECT_EQ(first.rx_bytes, 1024u);
    EXPECT_EQ(first.tx_bytes, 512u);

    StatsCalculator calc;
    ContainerStats stats = calc.update(first);
    EXPECT_DOUBLE_EQ(stats.cpu, 40.0);   // 200 / 1000 * 2 * 100
    EXPECT_DOUBLE_EQ(stats.memory, 50.0); // (600 - 100) / 1000
    EXPECT_DOUBLE_EQ(stats.network_rx_bytes_per_sec, 0.0);

    StatsSample second = first;
    second.read = first.read + 2s;
    second.rx_bytes += 2048;
    second.tx_bytes += 1024;
    stats = calc.update(second);
    EXPECT_DOUBLE_EQ(stats.network_rx_bytes_per_sec, 1024.0);
    EXPECT_DOUBLE_EQ(stats.network_tx_bytes_per_sec, 512.0);
}

TEST_F(ParsersTest, StatsEdgeCasesYieldZero)
{
    StatsSample sample;
    sample.cpu_total = 100;
    sample.precpu_total = 100;
    sample.system_cpu = 50;
    sample.presystem_cpu = 100;
    sample.memory_usage = 500;
    sample.memory_limit = 0;

    StatsCalculator calc;
    ContainerStats stats = calc.update(sample);
    EXPECT_DOUBLE_EQ(stats.cpu, 0.0);
    EXPECT_DOUBLE_EQ(stats.memory, 0.0);
}

TEST_F(ParsersTest, OnlineCpusFallsBackToPercpuCount)
{
    auto sample = parseStatsSample(R"({
        "cpu_stats": {"cpu_usage": {"total_usage": 1, "percpu_usage": [1, 0, 0, 0]}}
    })");
    EXPECT_EQ(sample.online_cpus, 4u);
}

TEST_F(ParsersTest, ErrorMessage)
{
    EXPECT_EQ(parseErrorMessage(R"({"message": "No such container: x"})"), "No such container: x");
    EXPECT_EQ(parseErrorMessage("page not found\n"), "page not found");
}

TEST_F(ParsersTest, Rfc3339)
{
    EXPECT_EQ(parseRfc3339("2023-11-14T22:13:20Z"), at(1700000000));
    EXPECT_EQ(parseRfc3339("2023-11-14T22:13:20.123456789Z"), at(1700000000, 123456789));
    EXPECT_EQ(parseRfc3339("2023-11-15T00:13:20+02:00"), at(1700000000));
    EXPECT_EQ(parseRfc3339("2023-11-14T21:13:20.25-01:00"), at(1700000000, 250000000));

    EXPECT_FALSE(parseRfc3339("2023-11-14 22:13:20Z"));
    EXPECT_FALSE(parseRfc3339("2023-11-14T22:13:20"));
    EXPECT_FALSE(parseRfc3339("2023-13-14T22:13:20Z"));
    EXPECT_FALSE(parseRfc3339("2023-11-14T22:13:20.Z"));
    EXPECT_FALSE(parseRfc3339("garbage"));
}

TEST_F(ParsersTest, UnixTimestampForQueries)
{
    EXPECT_EQ(formatUnixTimestamp(at(1700000000, 5)), "1700000000.000000005");
    EXPECT_EQ(formatUnixTimestamp(at(0)), "0.000000000");
}

TEST_F(ParsersTest, LogLineParsing)
{
    auto entry = parseLogLine("2023-11-14T22:13:20.000000001Z \x1b[32mGET /\x1b[0m 200\r\n");
    ASSERT_TRUE(entry);
    EXPECT_EQ(entry->timestamp, at(1700000000, 1));
    EXPECT_EQ(entry->text, "GET / 200");

    auto empty_message = parseLogLine("2023-11-14T22:13:20Z ");
    ASSERT_TRUE(empty_message);
    EXPECT_EQ(empty_message->text, "");

    EXPECT_FALSE(parseLogLine("no timestamp here"));
    EXPECT_FALSE(parseLogLine("2023-11-14T22:13:20Z"));
}

TEST_F(ParsersTest, StripAnsiHandlesOscAndCsi)
{
    EXPECT_EQ(stripAnsi("\x1b]0;title\x07text"), "text");
    EXPECT_EQ(stripAnsi("\x1b]8;;http://x\x1b\\link"), "link");
    EXPECT_EQ(stripAnsi("a\x1b[1;31mb\x1b[Kc"), "abc");
    EXPECT_EQ(stripAnsi("plain"), "plain");
}

TEST_F(ParsersTest, LineSplitterKeepsPartialLines)
{
    LineSplitter splitter;
    std::vector<std::string> lines;

    splitter.feed("one\ntw", lines);
    ASSERT_EQ(lines.size(), 1u);
    splitter.feed("o\nthree", lines);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1], "two");
    EXPECT_EQ(splitter.finish().value_or(""), "three");
    EXPECT_FALSE(splitter.finish());
}

TEST_F(ParsersTest, FramedLogsAreDemultiplexed)
{
    std::string data = frame(1, "2023-11-14T22:13:20Z out line\n") + frame(2, "2023-11-14T22:13:21Z err ");
    data += frame(2, "line\n");

    LogFrameDecoder decoder;
    std::vector<std::string> lines;
    // Feed in awkward pieces to cross header boundaries
    decoder.feed(data.substr(0, 3), lines);
    decoder.feed(data.substr(3, 10), lines);
    decoder.feed(data.substr(13), lines);
    decoder.finish(lines);

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "2023-11-14T22:13:20Z out line");
    EXPECT_EQ(lines[1], "2023-11-14T22:13:21Z err line");
}

TEST_F(ParsersTest, RawTtyLogsAreSplitOnNewlines)
{
    LogFrameDecoder decoder;
    std::vector<std::string> lines;
    decoder.feed("2023-11-14T22:13:20Z first\n2023-11-14T22:13:21Z sec", lines);
    decoder.feed("ond", lines);
    decoder.finish(lines);

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1], "2023-11-14T22:13:21Z second");
}
