#include <fcntl.h>
#include <spawn.h>
#include <unistd.h>
#include <sys/wait.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <dtop/core/logger.hpp>
#include <dtop/engine/action_executor.hpp>
#include <dtop/engine/container_monitor.hpp>
#include <dtop/engine/log_streamer.hpp>
#include <dtop/engine/services.hpp>
#include <memory>
#include <vector>

extern char** environ;

namespace dtop {
namespace engine {

namespace {

#ifdef __APPLE__
constexpr const char* URL_OPENER = "open";
#else
constexpr const char* URL_OPENER = "xdg-open";
#endif

std::string describeKey(const ContainerKey& key)
{
    return key.host_id + "/" + key.container_id;
}

} // namespace

RuntimeServices::RuntimeServices(EventSender sender, size_t log_batch_size, std::string url_opener)
    : sender_(std::move(sender)), log_batch_size_(log_batch_size), url_opener_(std::move(url_opener))
{}

std::string RuntimeServices::defaultUrlOpener()
{
    return URL_OPENER;
}

Task RuntimeServices::startHostMonitor(const HostConnection& host)
{
    EventSender sender = sender_;
    return Task::spawn("monitor:" + host.host_id, [host, sender](CancelToken& token) {
        ContainerMonitor monitor(host, sender);
        monitor.run(token);
    });
}

Task RuntimeServices::startLogTail(const HostConnection& host, const ContainerKey& key, LogSessionId session)
{
    EventSender sender = sender_;
    size_t batch_size = log_batch_size_;
    return Task::spawn("logs:" + describeKey(key), [host, key, session, sender, batch_size](CancelToken& token) {
        runLogTail(host, key, session, sender, batch_size, token);
    });
}

Task RuntimeServices::fetchOlderLogs(const HostConnection& host, const ContainerKey& key, LogSessionId session,
                                     const LogPageRequest& request)
{
    EventSender sender = sender_;
    return Task::spawn("older-logs:" + describeKey(key),
                       [host, key, session, request, sender](CancelToken& token) {
                           runOlderLogsFetch(host, key, session, request, sender, token);
                       });
}

void RuntimeServices::executeAction(const HostConnection& host, const ContainerKey& key,
                                    ContainerAction action)
{
    EventSender sender = sender_;
    Task task = Task::spawn("action:" + describeKey(key), [host, key, action, sender](CancelToken&) mutable {
        executeContainerAction(*host.client, key, action, sender);
    });
    // Actions run to completion; the body ignores cancellation
    track(std::move(task));
}

void RuntimeServices::openUrl(const std::string& url)
{
    std::vector<std::string> args = {url_opener_, url};
    Task task = Task::spawn("open-url", [args](CancelToken&) {
        std::vector<char*> argv;
        for (const auto& arg : args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        posix_spawn_file_actions_t actions;
        posix_spawn_file_actions_init(&actions);
        posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
        posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

        pid_t pid;
        int rc = posix_spawnp(&pid, argv[0], &actions, nullptr, argv.data(), environ);
        posix_spawn_file_actions_destroy(&actions);
        if (rc != 0) {
            Logger::getInstance()->warning("Could not run {}: {}", args[0], std::strerror(rc));
            return;
        }

        int status = 0;
        while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
        }
    });
    track(std::move(task));
}

void RuntimeServices::track(Task task)
{
    actions_.erase(std::remove_if(actions_.begin(), actions_.end(),
                                  [](const Task& t) { return t.isFinished(); }),
                   actions_.end());
    actions_.push_back(std::move(task));
}

} // namespace engine
} // namespace dtop
