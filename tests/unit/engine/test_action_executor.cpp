#include <gtest/gtest.h>
#include <dtop/engine/action_executor.hpp>
#include <fakes/fake_docker_client.hpp>
#include <memory>
#include <vector>

using namespace dtop;
using namespace dtop::engine;

class ActionExecutorTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        auto channel = makeEventChannel(16);
        sender = std::make_unique<EventSender>(std::move(channel.first));
        receiver = std::make_unique<EventReceiver>(std::move(channel.second));
    }

    std::vector<AppEvent> drain()
    {
        std::vector<AppEvent> events;
        AppEvent event;
        while (receiver->tryRecv(event)) {
            events.push_back(std::move(event));
        }
        return events;
    }

    const ContainerKey key{"prod", "abc123"};
    fakes::FakeDockerClient client;
    std::unique_ptr<EventSender> sender;
    std::unique_ptr<EventReceiver> receiver;
};

TEST_F(ActionExecutorTest, StopUsesGracePeriod)
{
    executeContainerAction(client, key, ContainerAction::Stop, *sender);

    auto calls = client.actions();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].verb, "stop");
    EXPECT_EQ(calls[0].id, "abc123");
    EXPECT_EQ(calls[0].grace, std::chrono::seconds(10));

    auto events = drain();
    ASSERT_EQ(events.size(), 2u);
    const auto& progress = std::get<events::ActionInProgress>(events[0]);
    EXPECT_EQ(progress.key, key);
    EXPECT_EQ(progress.action, ContainerAction::Stop);
    EXPECT_EQ(std::get<events::ActionSuccess>(events[1]).action, ContainerAction::Stop);
}

TEST_F(ActionExecutorTest, EachActionCallsItsEndpoint)
{
    executeContainerAction(client, key, ContainerAction::Start, *sender);
    executeContainerAction(client, key, ContainerAction::Restart, *sender);
    executeContainerAction(client, key, ContainerAction::Remove, *sender);

    auto calls = client.actions();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[0].verb, "start");
    EXPECT_EQ(calls[1].verb, "restart");
    EXPECT_EQ(calls[1].grace, ACTION_GRACE_PERIOD);
    EXPECT_EQ(calls[2].verb, "remove");
    EXPECT_TRUE(calls[2].force);
    EXPECT_FALSE(calls[2].remove_volumes);

    EXPECT_EQ(drain().size(), 6u);
}

TEST_F(ActionExecutorTest, FailureCarriesDaemonMessage)
{
    client.action_error = "driver failed programming external connectivity";
    executeContainerAction(client, key, ContainerAction::Start, *sender);

    auto events = drain();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<events::ActionInProgress>(events[0]));
    const auto& error = std::get<events::ActionError>(events[1]);
    EXPECT_EQ(error.key, key);
    EXPECT_EQ(error.action, ContainerAction::Start);
    EXPECT_EQ(error.message, "driver failed programming external connectivity");
}

TEST_F(ActionExecutorTest, ClosedChannelSkipsTheCall)
{
    receiver->close();
    executeContainerAction(client, key, ContainerAction::Restart, *sender);
    EXPECT_TRUE(client.actions().empty());
}
