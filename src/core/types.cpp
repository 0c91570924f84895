#include <algorithm>
#include <cctype>
#include <dtop/core/types.hpp>
#include <sstream>

namespace dtop {

namespace {

std::string lowercase(const std::string& text)
{
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool contains(const std::string& haystack, const char* needle)
{
    return haystack.find(needle) != std::string::npos;
}

} // namespace

ContainerState parseContainerState(const std::string& text)
{
    std::string s = lowercase(text);
    if (contains(s, "running"))
        return ContainerState::Running;
    if (contains(s, "paused"))
        return ContainerState::Paused;
    if (contains(s, "restarting"))
        return ContainerState::Restarting;
    if (contains(s, "removing"))
        return ContainerState::Removing;
    if (contains(s, "exited"))
        return ContainerState::Exited;
    if (contains(s, "dead"))
        return ContainerState::Dead;
    if (contains(s, "created"))
        return ContainerState::Created;
    return ContainerState::Unknown;
}

std::optional<HealthStatus> parseHealthStatus(const std::string& text)
{
    std::string s = lowercase(text);
    if (contains(s, "unhealthy"))
        return HealthStatus::Unhealthy;
    if (contains(s, "healthy"))
        return HealthStatus::Healthy;
    if (contains(s, "starting"))
        return HealthStatus::Starting;
    return std::nullopt;
}

const char* toString(ContainerState state)
{
    switch (state) {
        case ContainerState::Running:
            return "running";
        case ContainerState::Paused:
            return "paused";
        case ContainerState::Restarting:
            return "restarting";
        case ContainerState::Removing:
            return "removing";
        case ContainerState::Exited:
            return "exited";
        case ContainerState::Dead:
            return "dead";
        case ContainerState::Created:
            return "created";
        case ContainerState::Unknown:
        default:
            return "unknown";
    }
}

const char* toString(HealthStatus health)
{
    switch (health) {
        case HealthStatus::Healthy:
            return "healthy";
        case HealthStatus::Unhealthy:
            return "unhealthy";
        case HealthStatus::Starting:
        default:
            return "starting";
    }
}

std::string shortId(const std::string& id)
{
    return id.substr(0, std::min(SHORT_ID_LENGTH, id.size()));
}

const char* toString(ContainerAction action)
{
    switch (action) {
        case ContainerAction::Start:
            return "Start";
        case ContainerAction::Stop:
            return "Stop";
        case ContainerAction::Restart:
            return "Restart";
        case ContainerAction::Remove:
        default:
            return "Remove";
    }
}

std::vector<ContainerAction> availableActions(ContainerState state)
{
    switch (state) {
        case ContainerState::Running:
            return {ContainerAction::Stop, ContainerAction::Restart, ContainerAction::Remove};
        case ContainerState::Paused:
            return {ContainerAction::Stop, ContainerAction::Remove};
        case ContainerState::Exited:
        case ContainerState::Created:
        case ContainerState::Dead:
            return {ContainerAction::Start, ContainerAction::Remove};
        case ContainerState::Restarting:
        case ContainerState::Removing:
        case ContainerState::Unknown:
        default:
            return {};
    }
}

SortField nextSortField(SortField field)
{
    switch (field) {
        case SortField::Uptime:
            return SortField::Name;
        case SortField::Name:
            return SortField::Cpu;
        case SortField::Cpu:
            return SortField::Memory;
        case SortField::Memory:
        default:
            return SortField::Uptime;
    }
}

SortDirection defaultDirection(SortField field)
{
    // Names read A-Z; everything else shows the newest or busiest first
    return field == SortField::Name ? SortDirection::Ascending : SortDirection::Descending;
}

SortDirection toggled(SortDirection direction)
{
    return direction == SortDirection::Ascending ? SortDirection::Descending
                                                 : SortDirection::Ascending;
}

const char* toString(SortField field)
{
    switch (field) {
        case SortField::Uptime:
            return "Uptime";
        case SortField::Name:
            return "Name";
        case SortField::Cpu:
            return "CPU";
        case SortField::Memory:
        default:
            return "Memory";
    }
}

std::string formatUptime(const std::optional<Timestamp>& created, ContainerState state, Timestamp now)
{
    if (!created || state != ContainerState::Running) {
        return "N/A";
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - *created).count();
    if (elapsed < 0) {
        elapsed = 0;
    }

    long long days = elapsed / 86400;
    long long hours = (elapsed % 86400) / 3600;
    long long minutes = (elapsed % 3600) / 60;

    std::ostringstream oss;
    if (days > 0) {
        oss << days << "d " << hours << "h";
    }
    else if (hours > 0) {
        oss << hours << "h " << minutes << "m";
    }
    else if (minutes > 0) {
        oss << minutes << "m";
    }
    else {
        oss << elapsed << "s";
    }
    return oss.str();
}

} // namespace dtop
