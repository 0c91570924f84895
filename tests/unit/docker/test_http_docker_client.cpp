#include <gtest/gtest.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <atomic>
#include <condition_variable>
#include <cstring>
#include <dtop/core/error.hpp>
#include <dtop/docker/curl.hpp>
#include <dtop/docker/http_docker_client.hpp>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace dtop;
using namespace dtop::docker;
using namespace std::chrono_literals;

namespace {

std::string reply(const std::string& status_line, const std::string& body)
{
    return "HTTP/1.1 " + status_line + "\r\nContent-Type: application/json\r\nContent-Length: " +
           std::to_string(body.size()) + "\r\n\r\n" + body;
}

/**
 * @brief Unix socket server answering every request with the same bytes
 *
 * With hold_open the connection stays up after the response until the
 * daemon is destroyed, like a long-lived event stream.
 */
class CannedDaemon {
public:
    CannedDaemon(std::filesystem::path path, std::string response, bool hold_open = false)
        : path_(std::move(path)), response_(std::move(response)), hold_open_(hold_open)
    {
        std::filesystem::remove(path_);
        listen_fd_ = ::socket(AF_UNIX, SOCK_STREAM, 0);

        sockaddr_un address{};
        address.sun_family = AF_UNIX;
        std::strncpy(address.sun_path, path_.c_str(), sizeof(address.sun_path) - 1);
        if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&address), sizeof(address)) != 0 ||
            ::listen(listen_fd_, 8) != 0) {
            throw DtopError(ErrorCode::SYSTEM_ERROR, "cannot listen on " + path_.string());
        }
        thread_ = std::thread([this]() { serve(); });
    }

    ~CannedDaemon()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        cv_.notify_all();
        ::shutdown(listen_fd_, SHUT_RDWR);
        thread_.join();
        ::close(listen_fd_);
        std::filesystem::remove(path_);
    }

    std::vector<std::string> requestLines() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return request_lines_;
    }

private:
    void serve()
    {
        while (true) {
            int fd = ::accept(listen_fd_, nullptr, nullptr);
            if (fd < 0) {
                return;
            }
            handle(fd);
            ::close(fd);
        }
    }

    void handle(int fd)
    {
        std::string request;
        char buffer[1024];
        while (request.find("\r\n\r\n") == std::string::npos) {
            ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
            if (n <= 0) {
                return;
            }
            request.append(buffer, static_cast<size_t>(n));
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            request_lines_.push_back(request.substr(0, request.find("\r\n")));
        }
        ::send(fd, response_.data(), response_.size(), MSG_NOSIGNAL);

        if (hold_open_) {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stopping_; });
        }
    }

    std::filesystem::path path_;
    std::string response_;
    bool hold_open_;
    int listen_fd_ = -1;
    std::thread thread_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
    std::vector<std::string> request_lines_;
};

} // namespace

class HttpDockerClientTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        static std::atomic<int> counter{0};
        test_dir = std::filesystem::temp_directory_path() /
                   ("dtop_http_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(test_dir);
        socket_path = test_dir / "docker.sock";
    }

    void TearDown() override
    {
        std::filesystem::remove_all(test_dir);
    }

    std::unique_ptr<HttpDockerClient> client() const
    {
        Endpoint endpoint;
        endpoint.unix_socket = socket_path.string();
        return std::make_unique<HttpDockerClient>(endpoint);
    }

    CurlGlobal curl;
    std::filesystem::path test_dir;
    std::filesystem::path socket_path;
};

TEST_F(HttpDockerClientTest, UrlEncode)
{
    EXPECT_EQ(urlEncode("abc-_.~"), "abc-_.~");
    EXPECT_EQ(urlEncode("{\"a\":1}"), "%7B%22a%22%3A1%7D");
    EXPECT_EQ(urlEncode("a b/c"), "a%20b%2Fc");
}

TEST_F(HttpDockerClientTest, EventsTargetEncodesFilters)
{
    EXPECT_EQ(HttpDockerClient::eventsTarget(EventFilter{}), "/events");

    EventFilter filter{{"container"}, {"start", "die"}};
    EXPECT_EQ(HttpDockerClient::eventsTarget(filter),
              "/events?filters=" + urlEncode(R"({"event":["start","die"],"type":["container"]})"));
}

TEST_F(HttpDockerClientTest, LogsTarget)
{
    LogOptions tail;
    tail.follow = true;
    tail.tail = 1000;
    EXPECT_EQ(HttpDockerClient::logsTarget("abc", tail),
              "/containers/abc/logs?stdout=1&stderr=1&timestamps=1&follow=1&tail=1000");

    LogOptions range;
    range.since = Timestamp(std::chrono::seconds(100));
    range.until = Timestamp(std::chrono::seconds(200));
    EXPECT_EQ(HttpDockerClient::logsTarget("abc", range),
              "/containers/abc/logs?stdout=1&stderr=1&timestamps=1&since=100.000000000&until=200.000000000");
}

TEST_F(HttpDockerClientTest, LocalAndUnixHostsUseTheSocket)
{
    Endpoint local = endpointFor(parseHostSpec("unix:///run/user/1000/docker.sock"), ClientOptions());
    EXPECT_EQ(local.unix_socket.value_or(""), "/run/user/1000/docker.sock");
    EXPECT_EQ(local.base_url, "http://localhost");
    EXPECT_TRUE(local.dial_command.empty());
    EXPECT_FALSE(local.cert_file);
}

TEST_F(HttpDockerClientTest, TcpAndSshEndpoints)
{
    EXPECT_EQ(endpointFor(parseHostSpec("tcp://build-box"), ClientOptions()).base_url, "http://build-box:2375");
    EXPECT_EQ(endpointFor(parseHostSpec("tcp://[fd00::1]:2380"), ClientOptions()).base_url,
              "http://[fd00::1]:2380");

    HostSpec ssh = parseHostSpec("ssh://ops@box:2200");
    Endpoint endpoint = endpointFor(ssh, ClientOptions());
    EXPECT_EQ(endpoint.dial_command, sshDialCommand(ssh));
    EXPECT_FALSE(endpoint.unix_socket);
}

TEST_F(HttpDockerClientTest, TlsHostUsesCertificatesFromCertPath)
{
    for (const char* name : {"ca.pem", "cert.pem", "key.pem"}) {
        std::ofstream(test_dir / name) << "-----BEGIN CERTIFICATE-----\n";
    }
    ClientOptions options;
    options.cert_path = test_dir;

    auto tls = makeDockerClient(parseHostSpec("tls://secure.example.com"), options);
    ASSERT_NE(tls, nullptr);
    const Endpoint& endpoint = tls->endpoint();
    EXPECT_EQ(endpoint.base_url, "https://secure.example.com:2376");
    EXPECT_EQ(endpoint.ca_file.value_or(""), (test_dir / "ca.pem").string());
    EXPECT_EQ(endpoint.cert_file.value_or(""), (test_dir / "cert.pem").string());
    EXPECT_EQ(endpoint.key_file.value_or(""), (test_dir / "key.pem").string());
}

TEST_F(HttpDockerClientTest, TlsHostWithoutCertificatesFailsToConnect)
{
    ClientOptions options;
    options.cert_path = test_dir / "missing";
    try {
        makeDockerClient(parseHostSpec("tls://secure.example.com:2400"), options);
        FAIL() << "expected CONNECTION_FAILED";
    }
    catch (const DtopError& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::CONNECTION_FAILED);
        EXPECT_NE(e.detail().find("ca.pem"), std::string::npos);
    }
}

TEST_F(HttpDockerClientTest, ListContainersSendsRequestAndParses)
{
    CannedDaemon daemon(socket_path, reply("200 OK", R"([{"Id":"0123456789abcdef","Names":["/web"],)"
                                                     R"("State":"running","Status":"Up 1 minute"}])"));

    auto list = client()->listContainers(true);
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0].names[0], "web");
    ASSERT_EQ(daemon.requestLines().size(), 1u);
    EXPECT_EQ(daemon.requestLines()[0], "GET /containers/json?all=1 HTTP/1.1");
}

TEST_F(HttpDockerClientTest, NotFoundMapsToContainerNotFound)
{
    CannedDaemon daemon(socket_path, reply("404 Not Found", R"({"message":"No such container: nope1"})"));
    try {
        client()->inspectContainer("nope");
        FAIL() << "expected CONTAINER_NOT_FOUND";
    }
    catch (const DtopError& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::CONTAINER_NOT_FOUND);
        EXPECT_EQ(e.detail(), "No such container: nope1");
    }
}

TEST_F(HttpDockerClientTest, ActionFailureCarriesDaemonMessage)
{
    CannedDaemon daemon(socket_path, reply("409 Conflict", R"({"message":"already stopped"})"));
    try {
        client()->stopContainer("abc", 10s);
        FAIL() << "expected ACTION_FAILED";
    }
    catch (const DtopError& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::ACTION_FAILED);
        EXPECT_EQ(e.detail(), "already stopped");
    }
    EXPECT_EQ(daemon.requestLines().at(0), "POST /containers/abc/stop?t=10 HTTP/1.1");
}

TEST_F(HttpDockerClientTest, RemoveUsesForceAndVolumeFlags)
{
    CannedDaemon daemon(socket_path, "HTTP/1.1 204 No Content\r\n\r\n");
    client()->removeContainer("abc", true, false);
    EXPECT_EQ(daemon.requestLines().at(0), "DELETE /containers/abc?force=1&v=0 HTTP/1.1");
}

TEST_F(HttpDockerClientTest, PingOutcomes)
{
    try {
        client()->ping(1s);
        FAIL() << "expected CONNECTION_FAILED without a daemon";
    }
    catch (const DtopError& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::CONNECTION_FAILED);
    }

    {
        CannedDaemon silent(socket_path, "", true);
        try {
            client()->ping(200ms);
            FAIL() << "expected PING_TIMEOUT";
        }
        catch (const DtopError& e) {
            EXPECT_EQ(e.getErrorCode(), ErrorCode::PING_TIMEOUT);
        }
    }

    CannedDaemon healthy(socket_path, "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nOK");
    EXPECT_NO_THROW(client()->ping(1s));
    EXPECT_EQ(healthy.requestLines().at(0), "GET /_ping HTTP/1.1");
}

TEST_F(HttpDockerClientTest, EventStreamSkipsMalformedLines)
{
    CannedDaemon daemon(socket_path, reply("200 OK", R"({"Type":"container","Action":"start","Actor":{"ID":"a1"}})"
                                                     "\n{broken\n"
                                                     R"({"Type":"container","Action":"die","Actor":{"ID":"a1"}})"
                                                     "\n"));

    auto docker = client();
    auto stream = docker->subscribeEvents(EventFilter{{"container"}, {}});
    auto first = stream->next();
    ASSERT_TRUE(first);
    EXPECT_EQ(first->action, "start");
    auto second = stream->next();
    ASSERT_TRUE(second);
    EXPECT_EQ(second->action, "die");
    EXPECT_FALSE(stream->next());
}

TEST_F(HttpDockerClientTest, LogStreamDemultiplexesFrames)
{
    std::string payload = "2023-11-14T22:13:20Z hello\n";
    std::string frame(8, '\0');
    frame[0] = 1;
    frame[7] = static_cast<char>(payload.size());
    CannedDaemon daemon(socket_path, reply("200 OK", frame + payload));

    LogOptions options;
    options.tail = 10;
    auto docker = client();
    auto stream = docker->streamLogs("abc", options);

    auto line = stream->next();
    ASSERT_TRUE(line);
    EXPECT_EQ(*line, "2023-11-14T22:13:20Z hello");
    EXPECT_FALSE(stream->next());
}

TEST_F(HttpDockerClientTest, CancelWakesBlockedStream)
{
    CannedDaemon daemon(socket_path, "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n", true);
    auto docker = client();
    auto stream = docker->subscribeEvents(EventFilter{});

    std::thread canceller([&stream]() {
        std::this_thread::sleep_for(50ms);
        stream->cancel();
    });
    auto started = std::chrono::steady_clock::now();
    EXPECT_FALSE(stream->next());
    canceller.join();
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}

TEST_F(HttpDockerClientTest, DialCommandCarriesTheConnection)
{
    Endpoint endpoint;
    endpoint.base_url = "http://127.0.0.1";
    endpoint.dial_command = {"sh", "-c",
                             "while read -r line && [ \"$line\" != \"$(printf '\\r')\" ]; do :; done; "
                             "printf 'HTTP/1.1 200 OK\\r\\nContent-Length: 2\\r\\n\\r\\nOK'"};
    HttpDockerClient dialed(endpoint);
    EXPECT_NO_THROW(dialed.ping(2s));

    endpoint.dial_command = {"/nonexistent/dtop-dial"};
    HttpDockerClient broken(endpoint);
    try {
        broken.ping(2s);
        FAIL() << "expected CONNECTION_FAILED";
    }
    catch (const DtopError& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::CONNECTION_FAILED);
    }
}
