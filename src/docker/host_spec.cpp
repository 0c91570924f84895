#include <cstdlib>
#include <dtop/core/error.hpp>
#include <dtop/docker/host_spec.hpp>

namespace dtop {
namespace docker {

namespace {

constexpr const char* UNIX_PREFIX = "unix://";

int parsePort(const std::string& text, const std::string& spec)
{
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw DtopError(ErrorCode::INVALID_HOST_SPEC, "Invalid port in host: " + spec);
    }
    int port = std::atoi(text.c_str());
    if (port <= 0 || port > 65535) {
        throw DtopError(ErrorCode::INVALID_HOST_SPEC, "Port out of range in host: " + spec);
    }
    return port;
}

// Splits "[user@]host[:port][/path]" into the spec's fields
void parseAuthority(const std::string& authority, const std::string& raw, HostSpec& spec)
{
    std::string rest = authority;

    size_t slash = rest.find('/');
    if (slash != std::string::npos) {
        rest = rest.substr(0, slash);
    }

    size_t at = rest.rfind('@');
    if (at != std::string::npos) {
        spec.user = rest.substr(0, at);
        rest = rest.substr(at + 1);
    }

    if (!rest.empty() && rest[0] == '[') {
        size_t close = rest.find(']');
        if (close == std::string::npos) {
            throw DtopError(ErrorCode::INVALID_HOST_SPEC, "Unterminated IPv6 address in host: " + raw);
        }
        spec.host = rest.substr(1, close - 1);
        if (close + 1 < rest.size()) {
            if (rest[close + 1] != ':') {
                throw DtopError(ErrorCode::INVALID_HOST_SPEC, "Invalid host: " + raw);
            }
            spec.port = parsePort(rest.substr(close + 2), raw);
        }
    }
    else {
        size_t colon = rest.rfind(':');
        if (colon != std::string::npos) {
            spec.host = rest.substr(0, colon);
            spec.port = parsePort(rest.substr(colon + 1), raw);
        }
        else {
            spec.host = rest;
        }
    }

    if (spec.host.empty()) {
        throw DtopError(ErrorCode::INVALID_HOST_SPEC, "Missing host name in: " + raw);
    }
}

} // namespace

HostSpec parseHostSpec(const std::string& text)
{
    HostSpec spec;
    spec.raw = text;

    if (text.empty() || text == "local") {
        spec.scheme = HostScheme::Local;
        spec.path = localSocketPath();
        spec.host_id = "local";
        return spec;
    }

    size_t sep = text.find("://");
    if (sep == std::string::npos) {
        throw DtopError(ErrorCode::INVALID_HOST_SPEC, "Host must be 'local' or a URL: " + text);
    }

    std::string scheme = text.substr(0, sep);
    std::string rest = text.substr(sep + 3);

    if (scheme == "unix") {
        if (rest.empty()) {
            throw DtopError(ErrorCode::INVALID_HOST_SPEC, "Missing socket path in: " + text);
        }
        spec.scheme = HostScheme::Unix;
        spec.path = rest;
        spec.host_id = text;
        return spec;
    }

    if (scheme == "ssh") {
        spec.scheme = HostScheme::Ssh;
    }
    else if (scheme == "tcp") {
        spec.scheme = HostScheme::Tcp;
    }
    else if (scheme == "tls") {
        spec.scheme = HostScheme::Tls;
    }
    else {
        throw DtopError(ErrorCode::INVALID_HOST_SPEC, "Unsupported host scheme '" + scheme + "' in: " + text);
    }

    parseAuthority(rest, text, spec);

    if (spec.scheme == HostScheme::Tcp && !spec.port) {
        spec.port = DEFAULT_TCP_PORT;
    }
    else if (spec.scheme == HostScheme::Tls && !spec.port) {
        spec.port = DEFAULT_TLS_PORT;
    }

    spec.host_id = spec.host;
    return spec;
}

std::string localSocketPath()
{
    const char* docker_host = std::getenv("DOCKER_HOST");
    if (docker_host != nullptr) {
        std::string value = docker_host;
        if (value.rfind(UNIX_PREFIX, 0) == 0 && value.size() > std::char_traits<char>::length(UNIX_PREFIX)) {
            return value.substr(std::char_traits<char>::length(UNIX_PREFIX));
        }
    }
    return DEFAULT_SOCKET_PATH;
}

std::vector<std::string> sshDialCommand(const HostSpec& spec)
{
    std::vector<std::string> argv = {"ssh", "-o", "BatchMode=yes", "-o", "ConnectTimeout=10"};
    if (spec.user) {
        argv.push_back("-l");
        argv.push_back(*spec.user);
    }
    if (spec.port) {
        argv.push_back("-p");
        argv.push_back(std::to_string(*spec.port));
    }
    argv.push_back(spec.host);
    argv.push_back("--");
    argv.push_back("docker");
    argv.push_back("system");
    argv.push_back("dial-stdio");
    return argv;
}

const char* toString(HostScheme scheme)
{
    switch (scheme) {
        case HostScheme::Local:
            return "local";
        case HostScheme::Unix:
            return "unix";
        case HostScheme::Ssh:
            return "ssh";
        case HostScheme::Tcp:
            return "tcp";
        case HostScheme::Tls:
            return "tls";
    }
    return "unknown";
}

} // namespace docker
} // namespace dtop
