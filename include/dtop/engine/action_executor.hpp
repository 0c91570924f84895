#pragma once

#include <chrono>
#include <dtop/core/event.hpp>
#include <dtop/docker/docker_client.hpp>

namespace dtop {
namespace engine {

// Grace period handed to the daemon before it kills a stopping container
constexpr std::chrono::seconds ACTION_GRACE_PERIOD{10};

/**
 * @brief Run one container action, reporting progress through the channel
 *
 * Sends ActionInProgress, calls the daemon (stop and restart with a 10 s
 * grace period, remove forced but keeping volumes), then sends ActionSuccess
 * or ActionError with the daemon's message. Container state is left to the
 * lifecycle monitor.
 */
void executeContainerAction(docker::DockerClient& client, const ContainerKey& key, ContainerAction action,
                            EventSender& sender);

} // namespace engine
} // namespace dtop
