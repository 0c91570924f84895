#include <unistd.h>
#include <dtop/core/logger.hpp>
#include <dtop/docker/curl.hpp>

namespace dtop {
namespace docker {

namespace {

// Upper bound on one wait; curl's own timers and cancel() wake it sooner
constexpr int POLL_INTERVAL_MS = 1000;

void setOption(CURLcode code, const char* option)
{
    if (code != CURLE_OK) {
        throw DtopError(ErrorCode::CONNECTION_FAILED,
                        std::string("Setting ") + option + ": " + curl_easy_strerror(code));
    }
}

} // namespace

// CurlGlobal implementation
CurlGlobal::CurlGlobal()
{
    CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (code != CURLE_OK) {
        throw DtopError(ErrorCode::SYSTEM_ERROR, std::string("curl_global_init: ") + curl_easy_strerror(code));
    }
}

CurlGlobal::~CurlGlobal()
{
    curl_global_cleanup();
}

// CurlTransfer implementation
CurlTransfer::CurlTransfer(const Endpoint& endpoint, const std::string& method, const std::string& target,
                           std::chrono::milliseconds timeout)
    : url_(endpoint.base_url + target), dial_command_(endpoint.dial_command), easy_(curl_easy_init())
{
    if (!easy_) {
        throw DtopError(ErrorCode::SYSTEM_ERROR, "curl_easy_init failed");
    }
    configure(endpoint, method, timeout);

    multi_.reset(curl_multi_init());
    if (!multi_) {
        throw DtopError(ErrorCode::SYSTEM_ERROR, "curl_multi_init failed");
    }
    CURLMcode added = curl_multi_add_handle(multi_.get(), easy_.get());
    if (added != CURLM_OK) {
        throw DtopError(ErrorCode::SYSTEM_ERROR, std::string("curl_multi_add_handle: ") + curl_multi_strerror(added));
    }
}

CurlTransfer::~CurlTransfer()
{
    // Closing the connection runs onCloseSocket, which needs dial_ alive
    if (multi_) {
        curl_multi_remove_handle(multi_.get(), easy_.get());
    }
    easy_.reset();
    multi_.reset();
}

void CurlTransfer::configure(const Endpoint& endpoint, const std::string& method,
                             std::chrono::milliseconds timeout)
{
    CURL* easy = easy_.get();

    setOption(curl_easy_setopt(easy, CURLOPT_URL, url_.c_str()), "URL");
    setOption(curl_easy_setopt(easy, CURLOPT_NOSIGNAL, 1L), "NOSIGNAL");
    setOption(curl_easy_setopt(easy, CURLOPT_FORBID_REUSE, 1L), "FORBID_REUSE");
    setOption(curl_easy_setopt(easy, CURLOPT_USERAGENT, "dtop"), "USERAGENT");
    setOption(curl_easy_setopt(easy, CURLOPT_ERRORBUFFER, error_buffer_), "ERRORBUFFER");
    setOption(curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, &CurlTransfer::onWrite), "WRITEFUNCTION");
    setOption(curl_easy_setopt(easy, CURLOPT_WRITEDATA, this), "WRITEDATA");
    setOption(curl_easy_setopt(easy, CURLOPT_HEADERFUNCTION, &CurlTransfer::onHeader), "HEADERFUNCTION");
    setOption(curl_easy_setopt(easy, CURLOPT_HEADERDATA, this), "HEADERDATA");
    setOption(curl_easy_setopt(easy, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(endpoint.connect_timeout.count())),
              "CONNECTTIMEOUT_MS");
    if (timeout.count() > 0) {
        setOption(curl_easy_setopt(easy, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count())), "TIMEOUT_MS");
    }

    if (method == "POST") {
        setOption(curl_easy_setopt(easy, CURLOPT_POST, 1L), "POST");
        setOption(curl_easy_setopt(easy, CURLOPT_POSTFIELDS, ""), "POSTFIELDS");
        setOption(curl_easy_setopt(easy, CURLOPT_POSTFIELDSIZE, 0L), "POSTFIELDSIZE");
    }
    else if (method != "GET") {
        setOption(curl_easy_setopt(easy, CURLOPT_CUSTOMREQUEST, method.c_str()), "CUSTOMREQUEST");
    }

    if (endpoint.unix_socket) {
        setOption(curl_easy_setopt(easy, CURLOPT_UNIX_SOCKET_PATH, endpoint.unix_socket->c_str()),
                  "UNIX_SOCKET_PATH");
    }

    if (!dial_command_.empty()) {
        setOption(curl_easy_setopt(easy, CURLOPT_OPENSOCKETFUNCTION, &CurlTransfer::onOpenSocket),
                  "OPENSOCKETFUNCTION");
        setOption(curl_easy_setopt(easy, CURLOPT_OPENSOCKETDATA, this), "OPENSOCKETDATA");
        setOption(curl_easy_setopt(easy, CURLOPT_SOCKOPTFUNCTION, &CurlTransfer::onSocketOption),
                  "SOCKOPTFUNCTION");
        setOption(curl_easy_setopt(easy, CURLOPT_SOCKOPTDATA, this), "SOCKOPTDATA");
        setOption(curl_easy_setopt(easy, CURLOPT_CLOSESOCKETFUNCTION, &CurlTransfer::onCloseSocket),
                  "CLOSESOCKETFUNCTION");
        setOption(curl_easy_setopt(easy, CURLOPT_CLOSESOCKETDATA, this), "CLOSESOCKETDATA");
    }

    if (endpoint.ca_file) {
        setOption(curl_easy_setopt(easy, CURLOPT_CAINFO, endpoint.ca_file->c_str()), "CAINFO");
    }
    if (endpoint.cert_file) {
        setOption(curl_easy_setopt(easy, CURLOPT_SSLCERT, endpoint.cert_file->c_str()), "SSLCERT");
    }
    if (endpoint.key_file) {
        setOption(curl_easy_setopt(easy, CURLOPT_SSLKEY, endpoint.key_file->c_str()), "SSLKEY");
    }
    if (endpoint.ca_file || endpoint.cert_file) {
        setOption(curl_easy_setopt(easy, CURLOPT_SSL_VERIFYPEER, 1L), "SSL_VERIFYPEER");
        setOption(curl_easy_setopt(easy, CURLOPT_SSL_VERIFYHOST, 2L), "SSL_VERIFYHOST");
    }
}

long CurlTransfer::status()
{
    while (!head_done_ && !finished_) {
        step();
    }
    if (!head_done_) {
        if (cancelled_.load()) {
            throw DtopError(ErrorCode::STREAM_CANCELLED, url_);
        }
        throw DtopError(ErrorCode::HTTP_ERROR, url_ + ": no response head");
    }
    return status_;
}

bool CurlTransfer::readSome(std::string& out)
{
    while (body_.empty() && !finished_) {
        step();
    }
    if (body_.empty()) {
        return false;
    }
    out += body_;
    body_.clear();
    return true;
}

std::string CurlTransfer::readAll()
{
    std::string body;
    while (readSome(body)) {
    }
    return body;
}

void CurlTransfer::cancel()
{
    cancelled_.store(true);
    curl_multi_wakeup(multi_.get());
}

void CurlTransfer::step()
{
    if (started_) {
        CURLMcode polled = curl_multi_poll(multi_.get(), nullptr, 0, POLL_INTERVAL_MS, nullptr);
        if (polled != CURLM_OK) {
            throw DtopError(ErrorCode::STREAM_ERROR, url_ + ": " + curl_multi_strerror(polled));
        }
    }
    started_ = true;

    if (cancelled_.load()) {
        finished_ = true;
        return;
    }

    int running = 0;
    CURLMcode performed = curl_multi_perform(multi_.get(), &running);
    if (performed != CURLM_OK) {
        throw DtopError(ErrorCode::STREAM_ERROR, url_ + ": " + curl_multi_strerror(performed));
    }
    if (running == 0) {
        finish();
    }
}

void CurlTransfer::finish()
{
    finished_ = true;

    CURLcode result = CURLE_OK;
    int remaining = 0;
    while (CURLMsg* message = curl_multi_info_read(multi_.get(), &remaining)) {
        if (message->msg == CURLMSG_DONE) {
            result = message->data.result;
        }
    }
    if (result == CURLE_OK || cancelled_.load()) {
        return;
    }

    std::string reason = !dial_error_.empty()      ? dial_error_
                         : error_buffer_[0] != '\0' ? std::string(error_buffer_)
                                                    : std::string(curl_easy_strerror(result));
    throw DtopError(errorCodeFor(result), url_ + ": " + reason);
}

size_t CurlTransfer::onWrite(char* data, size_t size, size_t nmemb, void* user)
{
    auto* self = static_cast<CurlTransfer*>(user);
    if (self->cancelled_.load()) {
        return 0;
    }
    self->body_.append(data, size * nmemb);
    return size * nmemb;
}

size_t CurlTransfer::onHeader(char* data, size_t size, size_t nmemb, void* user)
{
    auto* self = static_cast<CurlTransfer*>(user);
    size_t length = size * nmemb;

    // A blank line ends a head; interim 1xx heads are followed by the real one
    bool blank = (length == 2 && data[0] == '\r' && data[1] == '\n') || (length == 1 && data[0] == '\n');
    if (blank) {
        long code = 0;
        curl_easy_getinfo(self->easy_.get(), CURLINFO_RESPONSE_CODE, &code);
        if (code >= 200) {
            self->status_ = code;
            self->head_done_ = true;
        }
    }
    return length;
}

curl_socket_t CurlTransfer::onOpenSocket(void* user, curlsocktype purpose, curl_sockaddr*)
{
    auto* self = static_cast<CurlTransfer*>(user);
    if (purpose != CURLSOCKTYPE_IPCXN || self->dial_) {
        return CURL_SOCKET_BAD;
    }

    try {
        self->dial_ = DialProcess::spawn(self->dial_command_);
    }
    catch (const DtopError& e) {
        self->dial_error_ = e.detail();
        Logger::getInstance()->warning("Dial command {} failed: {}", self->dial_command_.front(), e.detail());
        return CURL_SOCKET_BAD;
    }
    return self->dial_->fd();
}

int CurlTransfer::onSocketOption(void*, curl_socket_t, curlsocktype)
{
    return CURL_SOCKOPT_ALREADY_CONNECTED;
}

int CurlTransfer::onCloseSocket(void* user, curl_socket_t fd)
{
    auto* self = static_cast<CurlTransfer*>(user);
    if (self->dial_ && self->dial_->fd() == fd) {
        self->dial_.reset();
        return 0;
    }
    return ::close(fd);
}

ErrorCode errorCodeFor(CURLcode code)
{
    switch (code) {
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_GOT_NOTHING:
            return ErrorCode::CONNECTION_FAILED;
        case CURLE_WEIRD_SERVER_REPLY:
        case CURLE_BAD_CONTENT_ENCODING:
            return ErrorCode::HTTP_ERROR;
        default:
            return ErrorCode::STREAM_ERROR;
    }
}

std::string urlEncode(const std::string& value)
{
    std::unique_ptr<CURL, CurlEasyDeleter> easy(curl_easy_init());
    char* escaped = curl_easy_escape(easy.get(), value.data(), static_cast<int>(value.size()));
    if (escaped == nullptr) {
        throw DtopError(ErrorCode::SYSTEM_ERROR, "curl_easy_escape failed");
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

} // namespace docker
} // namespace dtop
