#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <dtop/core/task.hpp>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

using namespace dtop;
using namespace std::chrono_literals;

namespace {

bool waitFor(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = 2000ms)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(2ms);
    }
    return predicate();
}

} // namespace

class TaskTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(TaskTest, CancelTokenRunsHooksOnce)
{
    CancelToken token;
    int calls = 0;
    token.onCancel([&] { ++calls; });

    token.cancel();
    token.cancel();

    EXPECT_TRUE(token.isCancelled());
    EXPECT_EQ(calls, 1);
}

TEST_F(TaskTest, HookRegisteredAfterCancelRunsImmediately)
{
    CancelToken token;
    token.cancel();

    bool ran = false;
    token.onCancel([&] { ran = true; });
    EXPECT_TRUE(ran);
}

TEST_F(TaskTest, HookGuardUnregistersOnScopeExit)
{
    CancelToken token;
    bool ran = false;
    {
        CancelHookGuard guard(token, [&] { ran = true; });
    }
    token.cancel();
    EXPECT_FALSE(ran);
}

TEST_F(TaskTest, SleepForReturnsEarlyOnCancel)
{
    CancelToken token;
    EXPECT_TRUE(token.sleepFor(5ms));

    std::thread canceller([&] {
        std::this_thread::sleep_for(20ms);
        token.cancel();
    });
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(token.sleepFor(5000ms));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2000ms);
    canceller.join();
}

TEST_F(TaskTest, SpawnRunsBodyAndReportsFinished)
{
    std::atomic<int> value{0};
    Task task = Task::spawn("worker", [&](CancelToken&) { value = 7; });

    EXPECT_TRUE(task.valid());
    EXPECT_EQ(task.name(), "worker");
    task.join();
    EXPECT_EQ(value.load(), 7);
    EXPECT_TRUE(task.isFinished());
}

TEST_F(TaskTest, ExceptionInBodyStillFinishes)
{
    Task task = Task::spawn("thrower", [](CancelToken&) { throw std::runtime_error("boom"); });
    task.join();
    EXPECT_TRUE(task.isFinished());
}

TEST_F(TaskTest, CancelStopsLoopingBody)
{
    auto iterations = std::make_shared<std::atomic<int>>(0);
    Task task = Task::spawn("loop", [iterations](CancelToken& token) {
        while (token.sleepFor(1ms)) {
            ++*iterations;
        }
    });

    ASSERT_TRUE(waitFor([&] { return iterations->load() > 0; }));
    task.cancel();
    task.join();
    EXPECT_TRUE(task.isCancelled());
    EXPECT_TRUE(task.isFinished());
}

TEST_F(TaskTest, DestroyingTaskCancelsIt)
{
    std::shared_ptr<CancelToken> token;
    {
        Task task = Task::spawn("scoped", [](CancelToken& t) {
            while (t.sleepFor(5ms)) {
            }
        });
        token = task.token();
    }
    EXPECT_TRUE(token->isCancelled());
}

TEST_F(TaskTest, SlotReplaceCancelsPreviousTask)
{
    TaskSlot slot;
    EXPECT_FALSE(slot.active());

    Task first = Task::spawn("first", [](CancelToken& t) {
        while (t.sleepFor(5ms)) {
        }
    });
    auto first_token = first.token();
    slot.replace(std::move(first));
    EXPECT_TRUE(slot.active());

    Task second = Task::spawn("second", [](CancelToken& t) {
        while (t.sleepFor(5ms)) {
        }
    });
    auto second_token = second.token();
    slot.replace(std::move(second));

    EXPECT_TRUE(first_token->isCancelled());
    EXPECT_FALSE(second_token->isCancelled());

    slot.cancel();
    EXPECT_TRUE(second_token->isCancelled());
    EXPECT_FALSE(slot.active());
}

TEST_F(TaskTest, TaskMapKeepsOneTaskPerKey)
{
    TaskMap<std::string> tasks;
    auto spawnIdle = [](const std::string& name) {
        return Task::spawn(name, [](CancelToken& t) {
            while (t.sleepFor(5ms)) {
            }
        });
    };

    Task a1 = spawnIdle("a1");
    auto a1_token = a1.token();
    tasks.replace("a", std::move(a1));
    tasks.replace("b", spawnIdle("b"));
    EXPECT_EQ(tasks.size(), 2u);
    EXPECT_TRUE(tasks.isActive("a"));

    Task a2 = spawnIdle("a2");
    auto a2_token = a2.token();
    tasks.replace("a", std::move(a2));
    EXPECT_EQ(tasks.size(), 2u);
    EXPECT_TRUE(a1_token->isCancelled());

    EXPECT_TRUE(tasks.cancel("a"));
    EXPECT_TRUE(a2_token->isCancelled());
    EXPECT_FALSE(tasks.contains("a"));
    EXPECT_FALSE(tasks.cancel("a"));

    tasks.cancelAll();
    EXPECT_EQ(tasks.size(), 0u);
}

TEST_F(TaskTest, FinishedTaskIsNotActive)
{
    TaskMap<std::string> tasks;
    tasks.replace("done", Task::spawn("done", [](CancelToken&) {}));
    ASSERT_TRUE(waitFor([&] { return !tasks.isActive("done"); }));
    EXPECT_TRUE(tasks.contains("done"));
}

TEST_F(TaskTest, DetachedTaskCountsAsRunningUntilBodyReturns)
{
    size_t baseline = Task::runningCount();
    auto release = std::make_shared<std::atomic<bool>>(false);
    auto captured = std::make_shared<int>(42);
    std::weak_ptr<int> watch = captured;

    {
        // Ignores cancellation, like an action waiting on the daemon
        Task task = Task::spawn("stubborn", [release, captured](CancelToken&) {
            while (!release->load()) {
                std::this_thread::sleep_for(2ms);
            }
        });
    }
    captured.reset();

    EXPECT_GE(Task::runningCount(), 1u);
    EXPECT_FALSE(Task::waitForAll(20ms));
    EXPECT_FALSE(watch.expired());

    release->store(true);
    EXPECT_TRUE(waitFor([&] { return Task::runningCount() <= baseline && watch.expired(); }));
}
