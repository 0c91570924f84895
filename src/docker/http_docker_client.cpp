#include <deque>
#include <dtop/core/config.hpp>
#include <dtop/core/error.hpp>
#include <dtop/core/logger.hpp>
#include <dtop/docker/http_docker_client.hpp>
#include <dtop/docker/parsers.hpp>
#include <filesystem>
#include <functional>
#include <nlohmann/json.hpp>

namespace dtop {
namespace docker {

namespace {

constexpr std::chrono::milliseconds REQUEST_TIMEOUT{60000};
constexpr std::chrono::milliseconds NO_TIMEOUT{0};

// IPv6 literals need brackets inside a URL
std::string hostForUrl(const std::string& host)
{
    return host.find(':') != std::string::npos ? "[" + host + "]" : host;
}

void flushDecoder(LineSplitter& splitter, std::vector<std::string>& lines)
{
    if (auto rest = splitter.finish()) {
        lines.push_back(std::move(*rest));
    }
}

void flushDecoder(LogFrameDecoder& decoder, std::vector<std::string>& lines)
{
    decoder.finish(lines);
}

/**
 * @brief Stream of items decoded line by line from a long-lived response body
 */
template <typename T, typename Decoder>
class ResponseStream : public Stream<T> {
public:
    using Parser = std::function<std::optional<T>(const std::string&)>;

    ResponseStream(std::unique_ptr<CurlTransfer> transfer, Parser parser)
        : transfer_(std::move(transfer)), parser_(std::move(parser))
    {}

    std::optional<T> next() override
    {
        while (true) {
            while (!lines_.empty()) {
                std::string line = std::move(lines_.front());
                lines_.pop_front();
                if (auto item = parser_(line)) {
                    return item;
                }
            }

            if (finished_ || transfer_->cancelled()) {
                return std::nullopt;
            }

            std::string chunk;
            bool more;
            try {
                more = transfer_->readSome(chunk);
            }
            catch (const DtopError&) {
                if (transfer_->cancelled()) {
                    return std::nullopt;
                }
                throw;
            }

            std::vector<std::string> lines;
            decoder_.feed(chunk, lines);
            if (!more) {
                flushDecoder(decoder_, lines);
                finished_ = true;
            }
            lines_.insert(lines_.end(), std::make_move_iterator(lines.begin()),
                          std::make_move_iterator(lines.end()));
        }
    }

    void cancel() override
    {
        transfer_->cancel();
    }

private:
    std::unique_ptr<CurlTransfer> transfer_;
    Parser parser_;
    Decoder decoder_;
    std::deque<std::string> lines_;
    bool finished_ = false;
};

template <typename T>
std::optional<T> parseOrSkip(const std::string& line, T (*parse)(const std::string&), const char* what)
{
    if (line.empty()) {
        return std::nullopt;
    }
    try {
        return parse(line);
    }
    catch (const DtopError& e) {
        Logger::getInstance()->debug("Skipping malformed {}: {}", what, e.detail());
        return std::nullopt;
    }
}

ErrorCode codeForStatus(long status, ErrorCode fallback)
{
    return status == 404 ? ErrorCode::CONTAINER_NOT_FOUND : fallback;
}

} // namespace

HttpDockerClient::HttpDockerClient(Endpoint endpoint) : endpoint_(std::move(endpoint)) {}

std::unique_ptr<CurlTransfer> HttpDockerClient::open(const std::string& method, const std::string& target,
                                                     std::chrono::milliseconds timeout)
{
    auto transfer = std::make_unique<CurlTransfer>(endpoint_, method, target, timeout);
    transfer->status();
    return transfer;
}

std::string HttpDockerClient::call(const std::string& method, const std::string& target,
                                   ErrorCode failure_code)
{
    auto transfer = open(method, target, REQUEST_TIMEOUT);
    long status = transfer->status();
    std::string body = transfer->readAll();

    if (status >= 400) {
        throw DtopError(codeForStatus(status, failure_code), parseErrorMessage(body));
    }
    return body;
}

void HttpDockerClient::ping(std::chrono::milliseconds timeout)
{
    try {
        auto transfer = open("GET", "/_ping", timeout);
        long status = transfer->status();
        std::string body = transfer->readAll();
        if (status != 200) {
            throw DtopError(ErrorCode::CONNECTION_FAILED,
                            "ping returned HTTP " + std::to_string(status) + ": " + parseErrorMessage(body));
        }
    }
    catch (const DtopError& e) {
        if (e.getErrorCode() == ErrorCode::STREAM_ERROR) {
            throw DtopError(ErrorCode::PING_TIMEOUT, e.detail());
        }
        throw;
    }
}

std::vector<ContainerSummary> HttpDockerClient::listContainers(bool all)
{
    return parseContainerList(call("GET", all ? "/containers/json?all=1" : "/containers/json",
                                   ErrorCode::API_ERROR));
}

ContainerDetail HttpDockerClient::inspectContainer(const std::string& id)
{
    return parseContainerDetail(call("GET", "/containers/" + urlEncode(id) + "/json", ErrorCode::API_ERROR));
}

std::string HttpDockerClient::eventsTarget(const EventFilter& filter)
{
    nlohmann::json filters = nlohmann::json::object();
    if (!filter.types.empty()) {
        filters["type"] = filter.types;
    }
    if (!filter.actions.empty()) {
        filters["event"] = filter.actions;
    }
    if (filters.empty()) {
        return "/events";
    }
    return "/events?filters=" + urlEncode(filters.dump());
}

std::string HttpDockerClient::logsTarget(const std::string& id, const LogOptions& options)
{
    std::string target = "/containers/" + urlEncode(id) + "/logs?";
    target += options.stdout_stream ? "stdout=1" : "stdout=0";
    target += options.stderr_stream ? "&stderr=1" : "&stderr=0";
    if (options.timestamps) {
        target += "&timestamps=1";
    }
    if (options.follow) {
        target += "&follow=1";
    }
    if (options.tail) {
        target += "&tail=" + std::to_string(*options.tail);
    }
    if (options.since) {
        target += "&since=" + formatUnixTimestamp(*options.since);
    }
    if (options.until) {
        target += "&until=" + formatUnixTimestamp(*options.until);
    }
    return target;
}

std::unique_ptr<EventStream> HttpDockerClient::subscribeEvents(const EventFilter& filter)
{
    auto transfer = open("GET", eventsTarget(filter), NO_TIMEOUT);
    if (transfer->status() >= 400) {
        throw DtopError(ErrorCode::STREAM_ERROR, parseErrorMessage(transfer->readAll()));
    }
    return std::make_unique<ResponseStream<DaemonEvent, LineSplitter>>(
        std::move(transfer),
        [](const std::string& line) { return parseOrSkip(line, &parseDaemonEvent, "daemon event"); });
}

std::unique_ptr<StatsStream> HttpDockerClient::streamStats(const std::string& id)
{
    auto transfer = open("GET", "/containers/" + urlEncode(id) + "/stats?stream=1", NO_TIMEOUT);
    long status = transfer->status();
    if (status >= 400) {
        throw DtopError(codeForStatus(status, ErrorCode::STREAM_ERROR), parseErrorMessage(transfer->readAll()));
    }
    return std::make_unique<ResponseStream<StatsSample, LineSplitter>>(
        std::move(transfer),
        [](const std::string& line) { return parseOrSkip(line, &parseStatsSample, "stats sample"); });
}

std::unique_ptr<LogStream> HttpDockerClient::streamLogs(const std::string& id, const LogOptions& options)
{
    auto transfer = open("GET", logsTarget(id, options), options.follow ? NO_TIMEOUT : REQUEST_TIMEOUT);
    long status = transfer->status();
    if (status >= 400) {
        throw DtopError(codeForStatus(status, ErrorCode::STREAM_ERROR), parseErrorMessage(transfer->readAll()));
    }
    return std::make_unique<ResponseStream<std::string, LogFrameDecoder>>(
        std::move(transfer), [](const std::string& line) -> std::optional<std::string> {
            if (line.empty()) {
                return std::nullopt;
            }
            return line;
        });
}

void HttpDockerClient::startContainer(const std::string& id)
{
    call("POST", "/containers/" + urlEncode(id) + "/start", ErrorCode::ACTION_FAILED);
}

void HttpDockerClient::stopContainer(const std::string& id, std::chrono::seconds grace)
{
    call("POST", "/containers/" + urlEncode(id) + "/stop?t=" + std::to_string(grace.count()),
         ErrorCode::ACTION_FAILED);
}

void HttpDockerClient::restartContainer(const std::string& id, std::chrono::seconds grace)
{
    call("POST", "/containers/" + urlEncode(id) + "/restart?t=" + std::to_string(grace.count()),
         ErrorCode::ACTION_FAILED);
}

void HttpDockerClient::removeContainer(const std::string& id, bool force, bool remove_volumes)
{
    std::string target = "/containers/" + urlEncode(id) + "?force=" + (force ? "1" : "0") +
                         "&v=" + (remove_volumes ? "1" : "0");
    call("DELETE", target, ErrorCode::ACTION_FAILED);
}

Endpoint endpointFor(const HostSpec& spec, const ClientOptions& options)
{
    Endpoint endpoint;
    endpoint.connect_timeout = options.connect_timeout;

    switch (spec.scheme) {
        case HostScheme::Local:
        case HostScheme::Unix:
            endpoint.unix_socket = spec.path;
            break;
        case HostScheme::Ssh:
            // The dial process is the connection; no name lookup for a literal address
            endpoint.base_url = "http://127.0.0.1";
            endpoint.dial_command = sshDialCommand(spec);
            break;
        case HostScheme::Tcp:
            endpoint.base_url = "http://" + hostForUrl(spec.host) + ":" +
                                std::to_string(spec.port.value_or(DEFAULT_TCP_PORT));
            break;
        case HostScheme::Tls: {
            std::filesystem::path dir = options.cert_path.empty() ? defaultDockerCertPath() : options.cert_path;
            endpoint.base_url = "https://" + hostForUrl(spec.host) + ":" +
                                std::to_string(spec.port.value_or(DEFAULT_TLS_PORT));
            endpoint.ca_file = (dir / "ca.pem").string();
            endpoint.cert_file = (dir / "cert.pem").string();
            endpoint.key_file = (dir / "key.pem").string();
            break;
        }
    }
    return endpoint;
}

std::shared_ptr<HttpDockerClient> makeDockerClient(const HostSpec& spec, const ClientOptions& options)
{
    Endpoint endpoint = endpointFor(spec, options);
    for (const auto& file : {endpoint.ca_file, endpoint.cert_file, endpoint.key_file}) {
        if (file && !std::filesystem::exists(*file)) {
            throw DtopError(ErrorCode::CONNECTION_FAILED, "TLS file not found for " + spec.raw + ": " + *file);
        }
    }
    return std::make_shared<HttpDockerClient>(std::move(endpoint));
}

} // namespace docker
} // namespace dtop
