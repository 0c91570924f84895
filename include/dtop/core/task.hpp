#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>

namespace dtop {

/**
 * @brief Cooperative cancellation shared between a task and its owner
 *
 * Hooks let a task unblock its own I/O (typically shutting down a socket)
 * when the owner cancels it from another thread.
 */
class CancelToken {
public:
    using HookId = uint64_t;

    bool isCancelled() const
    {
        return cancelled_.load();
    }

    void cancel();

    /**
     * @brief Register a hook run once on cancel; runs immediately if already cancelled
     */
    HookId onCancel(std::function<void()> hook);
    void removeHook(HookId id);

    /**
     * @brief Sleep unless cancelled first
     * @return false if the token was cancelled before the duration elapsed
     */
    bool sleepFor(std::chrono::milliseconds duration);

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
    std::unordered_map<HookId, std::function<void()>> hooks_;
    HookId next_hook_id_ = 1;
};

/**
 * @brief RAII registration of a cancel hook
 */
class CancelHookGuard {
public:
    CancelHookGuard(CancelToken& token, std::function<void()> hook)
        : token_(token), id_(token.onCancel(std::move(hook)))
    {}
    ~CancelHookGuard()
    {
        token_.removeHook(id_);
    }

    CancelHookGuard(const CancelHookGuard&) = delete;
    CancelHookGuard& operator=(const CancelHookGuard&) = delete;

private:
    CancelToken& token_;
    CancelToken::HookId id_;
};

/**
 * @brief A named background thread with a cancel token
 *
 * Destroying a Task cancels it and detaches the thread: cancellation is
 * asynchronous, so the body must own (or share) everything it touches.
 * Detached threads still count as running until their body returns;
 * waitForAll() lets the process wait for them before static teardown.
 */
class Task {
public:
    using Body = std::function<void(CancelToken&)>;

    Task() = default;
    ~Task();

    Task(Task&& other) noexcept = default;
    Task& operator=(Task&& other) noexcept;
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    static Task spawn(std::string name, Body body);

    /**
     * @brief Wait until no task thread is running, detached ones included
     * @return false if some were still running when the timeout expired
     */
    static bool waitForAll(std::chrono::milliseconds timeout);

    /**
     * @brief Number of task threads whose body has not returned yet
     */
    static size_t runningCount();

    void cancel();
    void join();
    bool valid() const
    {
        return token_ != nullptr;
    }
    bool isFinished() const;
    bool isCancelled() const;
    const std::string& name() const
    {
        return name_;
    }
    std::shared_ptr<CancelToken> token() const
    {
        return token_;
    }

private:
    void release();

    std::string name_;
    std::shared_ptr<CancelToken> token_;
    std::shared_ptr<std::atomic<bool>> finished_;
    std::thread thread_;
};

/**
 * @brief Holds at most one task; storing a new one cancels the previous occupant
 */
class TaskSlot {
public:
    void replace(Task task)
    {
        task_.cancel();
        task_ = std::move(task);
    }

    void cancel()
    {
        task_.cancel();
        task_ = Task();
    }

    bool active() const
    {
        return task_.valid() && !task_.isFinished() && !task_.isCancelled();
    }

private:
    Task task_;
};

/**
 * @brief Key to task map enforcing at most one task per key
 */
template <typename Key, typename Hash = std::hash<Key>>
class TaskMap {
public:
    ~TaskMap()
    {
        cancelAll();
    }

    TaskMap() = default;
    TaskMap(const TaskMap&) = delete;
    TaskMap& operator=(const TaskMap&) = delete;

    /**
     * @brief Install a task for key, cancelling any task already there
     */
    void replace(const Key& key, Task task)
    {
        auto it = tasks_.find(key);
        if (it != tasks_.end()) {
            it->second.cancel();
            it->second = std::move(task);
        }
        else {
            tasks_.emplace(key, std::move(task));
        }
    }

    /**
     * @brief Cancel and forget the task for key
     * @return true if a task was tracked for key
     */
    bool cancel(const Key& key)
    {
        auto it = tasks_.find(key);
        if (it == tasks_.end()) {
            return false;
        }
        it->second.cancel();
        tasks_.erase(it);
        return true;
    }

    bool contains(const Key& key) const
    {
        return tasks_.find(key) != tasks_.end();
    }

    /**
     * @brief True while the task for key exists and has not finished
     */
    bool isActive(const Key& key) const
    {
        auto it = tasks_.find(key);
        return it != tasks_.end() && !it->second.isFinished() && !it->second.isCancelled();
    }

    size_t size() const
    {
        return tasks_.size();
    }

    void cancelAll()
    {
        for (auto& [key, task] : tasks_) {
            task.cancel();
        }
        tasks_.clear();
    }

private:
    std::unordered_map<Key, Task, Hash> tasks_;
};

} // namespace dtop
