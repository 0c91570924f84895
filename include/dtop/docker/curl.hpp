#pragma once

#include <curl/curl.h>
#include <atomic>
#include <chrono>
#include <dtop/core/error.hpp>
#include <dtop/docker/transport.hpp>
#include <memory>
#include <string>
#include <vector>

namespace dtop {
namespace docker {

/**
 * @brief Process-wide libcurl setup; main() holds one before starting any thread
 */
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

struct CurlEasyDeleter {
    void operator()(CURL* easy) const
    {
        curl_easy_cleanup(easy);
    }
};

struct CurlMultiDeleter {
    void operator()(CURLM* multi) const
    {
        curl_multi_cleanup(multi);
    }
};

/**
 * @brief One request to a daemon, read incrementally
 *
 * The transfer runs on its own multi handle, so the owning thread pulls the
 * body piece by piece instead of handing curl a callback for the whole
 * response. cancel() may be called from any thread; it wakes a blocked read,
 * which then reports end of body.
 */
class CurlTransfer {
public:
    /**
     * @param timeout Bound on the whole transfer; zero for long-lived streams
     * @throws DtopError(CONNECTION_FAILED) if curl rejects the endpoint settings
     */
    CurlTransfer(const Endpoint& endpoint, const std::string& method, const std::string& target,
                 std::chrono::milliseconds timeout);
    ~CurlTransfer();

    CurlTransfer(const CurlTransfer&) = delete;
    CurlTransfer& operator=(const CurlTransfer&) = delete;

    /**
     * @brief Drive the transfer until the response head is in
     * @return HTTP status code
     * @throws DtopError(CONNECTION_FAILED / STREAM_ERROR / HTTP_ERROR)
     */
    long status();

    /**
     * @brief Append the next piece of body to out
     * @return false at end of body
     */
    bool readSome(std::string& out);

    std::string readAll();

    void cancel();
    bool cancelled() const
    {
        return cancelled_.load();
    }

    const std::string& url() const
    {
        return url_;
    }

private:
    void configure(const Endpoint& endpoint, const std::string& method, std::chrono::milliseconds timeout);
    void step();
    void finish();

    static size_t onWrite(char* data, size_t size, size_t nmemb, void* user);
    static size_t onHeader(char* data, size_t size, size_t nmemb, void* user);
    static curl_socket_t onOpenSocket(void* user, curlsocktype purpose, curl_sockaddr* address);
    static int onSocketOption(void* user, curl_socket_t fd, curlsocktype purpose);
    static int onCloseSocket(void* user, curl_socket_t fd);

    std::string url_;
    std::vector<std::string> dial_command_;
    std::unique_ptr<DialProcess> dial_;
    std::string dial_error_;

    std::unique_ptr<CURL, CurlEasyDeleter> easy_;
    std::unique_ptr<CURLM, CurlMultiDeleter> multi_;
    char error_buffer_[CURL_ERROR_SIZE] = {};

    std::string body_;
    long status_ = 0;
    bool head_done_ = false;
    bool started_ = false;
    bool finished_ = false;
    std::atomic<bool> cancelled_{false};
};

/**
 * @brief Map a failed transfer to the error taxonomy
 *
 * Failures to reach or authenticate the daemon are CONNECTION_FAILED,
 * garbled responses HTTP_ERROR, everything else STREAM_ERROR.
 */
ErrorCode errorCodeFor(CURLcode code);

/**
 * @brief Percent-encode everything but unreserved characters
 */
std::string urlEncode(const std::string& value);

} // namespace docker
} // namespace dtop
