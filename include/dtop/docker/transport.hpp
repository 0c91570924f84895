#pragma once

#include <sys/types.h>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dtop {
namespace docker {

constexpr std::chrono::milliseconds DEFAULT_CONNECT_TIMEOUT{10000};

/**
 * @brief Where a daemon listens and how to reach it
 *
 * Exactly one way in is used: a unix socket, a dial command bridging the
 * daemon onto its stdio, or a plain TCP/TLS connection to base_url.
 */
struct Endpoint {
    std::string base_url = "http://localhost";
    std::optional<std::string> unix_socket;
    std::vector<std::string> dial_command;

    // TLS client material, all three set for tls:// hosts
    std::optional<std::string> ca_file;
    std::optional<std::string> cert_file;
    std::optional<std::string> key_file;

    std::chrono::milliseconds connect_timeout = DEFAULT_CONNECT_TIMEOUT;
};

/**
 * @brief Child process whose stdin/stdout are one end of a socket pair
 *
 * Used for ssh:// hosts: `ssh host docker system dial-stdio` bridges the
 * remote daemon socket onto the child's standard streams. Destroying the
 * object closes the socket and terminates the child.
 */
class DialProcess {
public:
    ~DialProcess();

    DialProcess(const DialProcess&) = delete;
    DialProcess& operator=(const DialProcess&) = delete;

    /**
     * @throws DtopError(CONNECTION_FAILED) if the socket pair or the child cannot be created
     */
    static std::unique_ptr<DialProcess> spawn(const std::vector<std::string>& argv);

    int fd() const
    {
        return fd_;
    }
    pid_t pid() const
    {
        return pid_;
    }

private:
    DialProcess(int fd, pid_t pid);

    int fd_;
    pid_t pid_;
};

} // namespace docker
} // namespace dtop
