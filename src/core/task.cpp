#include <dtop/core/logger.hpp>
#include <dtop/core/task.hpp>
#include <exception>
#include <system_error>
#include <vector>

namespace dtop {

namespace {

struct RunningTasks {
    std::mutex mutex;
    std::condition_variable cv;
    size_t count = 0;
};

RunningTasks& runningTasks()
{
    static RunningTasks running;
    return running;
}

} // namespace

void CancelToken::cancel()
{
    std::vector<std::function<void()>> hooks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_.exchange(true)) {
            return;
        }
        for (auto& [id, hook] : hooks_) {
            hooks.push_back(std::move(hook));
        }
        hooks_.clear();
    }

    cv_.notify_all();
    for (auto& hook : hooks) {
        hook();
    }
}

CancelToken::HookId CancelToken::onCancel(std::function<void()> hook)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!cancelled_) {
            HookId id = next_hook_id_++;
            hooks_.emplace(id, std::move(hook));
            return id;
        }
    }

    hook();
    return 0;
}

void CancelToken::removeHook(HookId id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    hooks_.erase(id);
}

bool CancelToken::sleepFor(std::chrono::milliseconds duration)
{
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, duration, [this] { return cancelled_.load(); });
}

Task::~Task()
{
    release();
}

Task& Task::operator=(Task&& other) noexcept
{
    if (this != &other) {
        release();
        name_ = std::move(other.name_);
        token_ = std::move(other.token_);
        finished_ = std::move(other.finished_);
        thread_ = std::move(other.thread_);
    }
    return *this;
}

Task Task::spawn(std::string name, Body body)
{
    Task task;
    task.name_ = std::move(name);
    task.token_ = std::make_shared<CancelToken>();
    task.finished_ = std::make_shared<std::atomic<bool>>(false);

    auto token = task.token_;
    auto finished = task.finished_;
    auto task_name = task.name_;
    RunningTasks& running = runningTasks();
    {
        std::lock_guard<std::mutex> lock(running.mutex);
        ++running.count;
    }
    auto run = [token, finished, task_name, &running, body = std::move(body)]() mutable {
        try {
            body(*token);
        }
        catch (const std::exception& e) {
            Logger::getInstance()->error("Task {} terminated: {}", task_name, e.what());
        }
        // Captured state goes before the count drops so nothing outlives waitForAll()
        body = nullptr;
        finished->store(true);

        std::lock_guard<std::mutex> lock(running.mutex);
        --running.count;
        running.cv.notify_all();
    };

    try {
        task.thread_ = std::thread(std::move(run));
    }
    catch (const std::system_error&) {
        std::lock_guard<std::mutex> lock(running.mutex);
        --running.count;
        throw;
    }
    return task;
}

bool Task::waitForAll(std::chrono::milliseconds timeout)
{
    RunningTasks& running = runningTasks();
    std::unique_lock<std::mutex> lock(running.mutex);
    return running.cv.wait_for(lock, timeout, [&running] { return running.count == 0; });
}

size_t Task::runningCount()
{
    RunningTasks& running = runningTasks();
    std::lock_guard<std::mutex> lock(running.mutex);
    return running.count;
}

void Task::cancel()
{
    if (token_) {
        token_->cancel();
    }
}

void Task::join()
{
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool Task::isFinished() const
{
    return finished_ && finished_->load();
}

bool Task::isCancelled() const
{
    return token_ && token_->isCancelled();
}

void Task::release()
{
    cancel();
    if (thread_.joinable()) {
        thread_.detach();
    }
    token_.reset();
    finished_.reset();
}

} // namespace dtop
