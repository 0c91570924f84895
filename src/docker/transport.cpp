#include <fcntl.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <dtop/core/error.hpp>
#include <dtop/docker/transport.hpp>

namespace dtop {
namespace docker {

namespace {

std::vector<char*> createArgv(const std::vector<std::string>& args)
{
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    return argv;
}

} // namespace

DialProcess::DialProcess(int fd, pid_t pid) : fd_(fd), pid_(pid) {}

DialProcess::~DialProcess()
{
    if (fd_ >= 0) {
        ::close(fd_);
    }
    if (pid_ > 0) {
        ::kill(pid_, SIGTERM);
        int status = 0;
        while (::waitpid(pid_, &status, 0) == -1 && errno == EINTR) {
        }
    }
}

std::unique_ptr<DialProcess> DialProcess::spawn(const std::vector<std::string>& args)
{
    if (args.empty()) {
        throw DtopError(ErrorCode::INVALID_HOST_SPEC, "Empty dial command");
    }

    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) == -1) {
        throw makeErrnoError(ErrorCode::CONNECTION_FAILED, "socketpair");
    }

    // Prepared before fork: the child may only call async-signal-safe functions
    std::vector<char*> argv = createArgv(args);

    pid_t pid = ::fork();
    if (pid == -1) {
        ::close(fds[0]);
        ::close(fds[1]);
        throw makeErrnoError(ErrorCode::CONNECTION_FAILED, "fork");
    }

    if (pid == 0) {
        ::dup2(fds[1], STDIN_FILENO);
        ::dup2(fds[1], STDOUT_FILENO);
        int devnull = ::open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDERR_FILENO);
        }
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }

    ::close(fds[1]);
    return std::unique_ptr<DialProcess>(new DialProcess(fds[0], pid));
}

} // namespace docker
} // namespace dtop
