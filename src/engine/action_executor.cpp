#include <dtop/core/error.hpp>
#include <dtop/core/logger.hpp>
#include <dtop/engine/action_executor.hpp>

namespace dtop {
namespace engine {

void executeContainerAction(docker::DockerClient& client, const ContainerKey& key, ContainerAction action,
                            EventSender& sender)
{
    auto* logger = Logger::getInstance();
    if (!sender.send(events::ActionInProgress{key, action})) {
        return;
    }

    logger->info("{} {}/{}", toString(action), key.host_id, key.container_id);
    try {
        switch (action) {
            case ContainerAction::Start:
                client.startContainer(key.container_id);
                break;
            case ContainerAction::Stop:
                client.stopContainer(key.container_id, ACTION_GRACE_PERIOD);
                break;
            case ContainerAction::Restart:
                client.restartContainer(key.container_id, ACTION_GRACE_PERIOD);
                break;
            case ContainerAction::Remove:
                client.removeContainer(key.container_id, true, false);
                break;
        }
    }
    catch (const DtopError& e) {
        logger->error("{} {}/{} failed: {}", toString(action), key.host_id, key.container_id, e.what());
        if (!sender.send(events::ActionError{key, action, e.detail()})) {
            logger->debug("Event channel closed before the action error was reported");
        }
        return;
    }

    if (!sender.send(events::ActionSuccess{key, action})) {
        logger->debug("Event channel closed before the action result was reported");
    }
}

} // namespace engine
} // namespace dtop
