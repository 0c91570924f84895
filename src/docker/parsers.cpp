#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <dtop/core/error.hpp>
#include <dtop/docker/parsers.hpp>
#include <nlohmann/json.hpp>

namespace dtop {
namespace docker {

namespace {

constexpr size_t FRAME_HEADER_SIZE = 8;

nlohmann::json parseJson(const std::string& text, const char* what)
{
    try {
        return nlohmann::json::parse(text);
    }
    catch (const nlohmann::json::parse_error& e) {
        throw DtopError(ErrorCode::PARSE_ERROR, std::string("Invalid ") + what + ": " + e.what());
    }
}

std::string stringField(const nlohmann::json& j, const char* key)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

uint64_t uintField(const nlohmann::json& j, const char* key)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) {
        return 0;
    }
    return it->get<uint64_t>();
}

const nlohmann::json& objectField(const nlohmann::json& j, const char* key)
{
    static const nlohmann::json empty = nlohmann::json::object();
    auto it = j.find(key);
    if (it == j.end() || !it->is_object()) {
        return empty;
    }
    return *it;
}

std::string trimLeadingSlash(const std::string& name)
{
    return !name.empty() && name[0] == '/' ? name.substr(1) : name;
}

} // namespace

std::vector<ContainerSummary> parseContainerList(const std::string& body)
{
    nlohmann::json json = parseJson(body, "container list");
    if (!json.is_array()) {
        throw DtopError(ErrorCode::PARSE_ERROR, "Container list is not an array");
    }

    std::vector<ContainerSummary> result;
    result.reserve(json.size());
    for (const auto& item : json) {
        if (!item.is_object()) {
            continue;
        }

        ContainerSummary summary;
        summary.id = stringField(item, "Id");
        summary.state = stringField(item, "State");
        summary.status = stringField(item, "Status");

        auto names = item.find("Names");
        if (names != item.end() && names->is_array()) {
            for (const auto& name : *names) {
                if (name.is_string()) {
                    summary.names.push_back(trimLeadingSlash(name.get<std::string>()));
                }
            }
        }

        auto created = item.find("Created");
        if (created != item.end() && created->is_number_integer()) {
            summary.created = created->get<int64_t>();
        }

        result.push_back(std::move(summary));
    }
    return result;
}

ContainerDetail parseContainerDetail(const std::string& body)
{
    nlohmann::json json = parseJson(body, "container detail");
    if (!json.is_object()) {
        throw DtopError(ErrorCode::PARSE_ERROR, "Container detail is not an object");
    }

    ContainerDetail detail;
    detail.id = stringField(json, "Id");
    detail.name = trimLeadingSlash(stringField(json, "Name"));
    detail.created = parseRfc3339(stringField(json, "Created"));

    const auto& state = objectField(json, "State");
    detail.state = stringField(state, "Status");
    const auto& health = objectField(state, "Health");
    std::string health_status = stringField(health, "Status");
    if (!health_status.empty()) {
        detail.health = health_status;
    }

    const auto& config = objectField(json, "Config");
    auto tty = config.find("Tty");
    detail.tty = tty != config.end() && tty->is_boolean() && tty->get<bool>();

    return detail;
}

DaemonEvent parseDaemonEvent(const std::string& line)
{
    nlohmann::json json = parseJson(line, "daemon event");

    DaemonEvent event;
    event.type = stringField(json, "Type");
    event.action = stringField(json, "Action");
    if (event.action.empty()) {
        event.action = stringField(json, "status"); // pre-1.22 daemons
    }

    const auto& actor = objectField(json, "Actor");
    event.actor_id = stringField(actor, "ID");
    if (event.actor_id.empty()) {
        event.actor_id = stringField(json, "id");
    }

    const auto& attributes = objectField(actor, "Attributes");
    for (auto& [key, value] : attributes.items()) {
        if (value.is_string()) {
            event.attributes[key] = value.get<std::string>();
        }
    }
    return event;
}

StatsSample parseStatsSample(const std::string& line)
{
    nlohmann::json json = parseJson(line, "stats sample");

    StatsSample sample;
    sample.read = parseRfc3339(stringField(json, "read")).value_or(std::chrono::system_clock::now());

    const auto& cpu = objectField(json, "cpu_stats");
    sample.cpu_total = uintField(objectField(cpu, "cpu_usage"), "total_usage");
    sample.system_cpu = uintField(cpu, "system_cpu_usage");
    sample.online_cpus = static_cast<uint32_t>(uintField(cpu, "online_cpus"));
    if (sample.online_cpus == 0) {
        auto percpu = objectField(cpu, "cpu_usage").find("percpu_usage");
        if (percpu != objectField(cpu, "cpu_usage").end() && percpu->is_array()) {
            sample.online_cpus = static_cast<uint32_t>(percpu->size());
        }
    }

    const auto& precpu = objectField(json, "precpu_stats");
    sample.precpu_total = uintField(objectField(precpu, "cpu_usage"), "total_usage");
    sample.presystem_cpu = uintField(precpu, "system_cpu_usage");

    const auto& memory = objectField(json, "memory_stats");
    sample.memory_usage = uintField(memory, "usage");
    sample.memory_limit = uintField(memory, "limit");
    const auto& memory_detail = objectField(memory, "stats");
    // cgroup v2 reports inactive_file, v1 total_inactive_file or cache
    for (const char* key : {"inactive_file", "total_inactive_file", "cache"}) {
        uint64_t value = uintField(memory_detail, key);
        if (value > 0 && value < sample.memory_usage) {
            sample.memory_cache = value;
            break;
        }
    }

    const auto& networks = objectField(json, "networks");
    for (auto& [name, iface] : networks.items()) {
        sample.rx_bytes += uintField(iface, "rx_bytes");
        sample.tx_bytes += uintField(iface, "tx_bytes");
    }

    return sample;
}

std::string parseErrorMessage(const std::string& body)
{
    try {
        nlohmann::json json = nlohmann::json::parse(body);
        std::string message = stringField(json, "message");
        if (!message.empty()) {
            return message;
        }
    }
    catch (const nlohmann::json::parse_error&) {
        // Plain-text error bodies are returned as they are
    }

    std::string trimmed = body;
    while (!trimmed.empty() && std::isspace(static_cast<unsigned char>(trimmed.back()))) {
        trimmed.pop_back();
    }
    return trimmed;
}

std::optional<Timestamp> parseRfc3339(const std::string& text)
{
    // 2025-10-28T12:34:56[.fraction](Z|+hh:mm|-hh:mm)
    int year, month, day, hour, minute, second;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &year, &month, &day, &hour,
                    &minute, &second, &consumed) != 6 ||
        consumed != 19) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 ||
        second > 60) {
        return std::nullopt;
    }

    size_t pos = 19;
    int64_t nanos = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 9) {
                nanos = nanos * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (; digits < 9; ++digits) {
            nanos *= 10;
        }
    }

    int64_t offset_seconds = 0;
    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
        ++pos;
    }
    else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        int off_hours, off_minutes;
        if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &off_hours, &off_minutes) != 2) {
            return std::nullopt;
        }
        offset_seconds = (off_hours * 3600 + off_minutes * 60) * (text[pos] == '+' ? 1 : -1);
        pos += 6;
    }
    else {
        return std::nullopt;
    }

    if (pos != text.size()) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    time_t seconds = ::timegm(&tm);

    auto since_epoch = std::chrono::seconds(seconds - offset_seconds) + std::chrono::nanoseconds(nanos);
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(since_epoch));
}

std::string formatUnixTimestamp(Timestamp timestamp)
{
    auto nanos =
        std::chrono::duration_cast<std::chrono::nanoseconds>(timestamp.time_since_epoch()).count();
    if (nanos < 0) {
        nanos = 0;
    }
    char buffer[40];
    std::snprintf(buffer, sizeof(buffer), "%lld.%09lld",
                  static_cast<long long>(nanos / 1000000000LL),
                  static_cast<long long>(nanos % 1000000000LL));
    return buffer;
}

std::string stripAnsi(const std::string& text)
{
    std::string result;
    result.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\r') {
            continue;
        }
        if (c != '\x1b') {
            result += c;
            continue;
        }

        // CSI: ESC [ params final-byte(0x40-0x7e)
        if (i + 1 < text.size() && text[i + 1] == '[') {
            i += 2;
            while (i < text.size() && !(text[i] >= 0x40 && text[i] <= 0x7e)) {
                ++i;
            }
        }
        // OSC: ESC ] ... BEL or ESC backslash
        else if (i + 1 < text.size() && text[i + 1] == ']') {
            i += 2;
            while (i < text.size() && text[i] != '\x07' &&
                   !(text[i] == '\x1b' && i + 1 < text.size() && text[i + 1] == '\\')) {
                ++i;
            }
            if (i < text.size() && text[i] == '\x1b') {
                ++i;
            }
        }
        else {
            ++i; // two-byte escape
        }
    }
    return result;
}

std::optional<LogEntry> parseLogLine(const std::string& line)
{
    size_t space = line.find(' ');
    if (space == std::string::npos) {
        return std::nullopt;
    }

    auto timestamp = parseRfc3339(line.substr(0, space));
    if (!timestamp) {
        return std::nullopt;
    }

    std::string message = stripAnsi(line.substr(space + 1));
    while (!message.empty() && message.back() == '\n') {
        message.pop_back();
    }
    return LogEntry{*timestamp, std::move(message)};
}

Container toContainer(const ContainerSummary& summary, const HostId& host_id,
                      const std::optional<std::string>& viewer_url)
{
    Container container;
    container.id = shortId(summary.id);
    container.name = summary.names.empty() ? "" : summary.names.front();
    container.state = parseContainerState(summary.state);
    container.health = parseHealthStatus(summary.status);
    if (summary.created) {
        container.created = Timestamp(std::chrono::seconds(*summary.created));
    }
    container.host_id = host_id;
    container.viewer_url = viewer_url;
    return container;
}

Container toContainer(const ContainerDetail& detail, const HostId& host_id,
                      const std::optional<std::string>& viewer_url)
{
    Container container;
    container.id = shortId(detail.id);
    container.name = detail.name;
    container.state = parseContainerState(detail.state);
    if (detail.health) {
        container.health = parseHealthStatus(*detail.health);
    }
    container.created = detail.created;
    container.host_id = host_id;
    container.viewer_url = viewer_url;
    return container;
}

std::optional<HealthStatus> healthFromAttributes(const DaemonEvent& event)
{
    for (const char* key : {"health_status", "HealthStatus"}) {
        auto it = event.attributes.find(key);
        if (it != event.attributes.end()) {
            return parseHealthStatus(it->second);
        }
    }
    return std::nullopt;
}

// LineSplitter implementation
void LineSplitter::feed(const std::string& data, std::vector<std::string>& lines)
{
    pending_ += data;

    size_t start = 0;
    size_t newline;
    while ((newline = pending_.find('\n', start)) != std::string::npos) {
        lines.push_back(pending_.substr(start, newline - start));
        start = newline + 1;
    }
    pending_.erase(0, start);
}

std::optional<std::string> LineSplitter::finish()
{
    if (pending_.empty()) {
        return std::nullopt;
    }
    std::string rest = std::move(pending_);
    pending_.clear();
    return rest;
}

// LogFrameDecoder implementation
void LogFrameDecoder::feed(const std::string& data, std::vector<std::string>& lines)
{
    buffer_ += data;

    if (mode_ == Mode::Detect) {
        if (buffer_.empty()) {
            return;
        }
        if (buffer_.size() < 4) {
            unsigned char first = static_cast<unsigned char>(buffer_[0]);
            if (first > 2) {
                mode_ = Mode::Raw;
            }
            else {
                return; // wait for enough bytes to decide
            }
        }
        else {
            unsigned char first = static_cast<unsigned char>(buffer_[0]);
            bool framed = first <= 2 && buffer_[1] == 0 && buffer_[2] == 0 && buffer_[3] == 0;
            mode_ = framed ? Mode::Framed : Mode::Raw;
        }
    }

    if (mode_ == Mode::Raw) {
        splitter_.feed(buffer_, lines);
        buffer_.clear();
        return;
    }

    while (buffer_.size() >= FRAME_HEADER_SIZE) {
        const auto* header = reinterpret_cast<const unsigned char*>(buffer_.data());
        size_t payload = (static_cast<size_t>(header[4]) << 24) |
                         (static_cast<size_t>(header[5]) << 16) |
                         (static_cast<size_t>(header[6]) << 8) | static_cast<size_t>(header[7]);
        if (buffer_.size() < FRAME_HEADER_SIZE + payload) {
            break;
        }
        splitter_.feed(buffer_.substr(FRAME_HEADER_SIZE, payload), lines);
        buffer_.erase(0, FRAME_HEADER_SIZE + payload);
    }
}

void LogFrameDecoder::finish(std::vector<std::string>& lines)
{
    if (mode_ != Mode::Framed && !buffer_.empty()) {
        splitter_.feed(buffer_, lines);
        buffer_.clear();
    }
    if (auto rest = splitter_.finish()) {
        lines.push_back(std::move(*rest));
    }
}

// StatsCalculator implementation
ContainerStats StatsCalculator::update(const StatsSample& sample)
{
    ContainerStats stats;

    if (sample.cpu_total > sample.precpu_total && sample.system_cpu > sample.presystem_cpu) {
        double cpu_delta = static_cast<double>(sample.cpu_total - sample.precpu_total);
        double system_delta = static_cast<double>(sample.system_cpu - sample.presystem_cpu);
        uint32_t cpus = sample.online_cpus > 0 ? sample.online_cpus : 1;
        stats.cpu = cpu_delta / system_delta * cpus * 100.0;
    }

    if (sample.memory_limit > 0) {
        uint64_t used = sample.memory_usage - std::min(sample.memory_cache, sample.memory_usage);
        stats.memory = static_cast<double>(used) / static_cast<double>(sample.memory_limit) * 100.0;
    }

    if (previous_) {
        double seconds = std::chrono::duration<double>(sample.read - previous_->read).count();
        if (seconds > 0.0) {
            if (sample.rx_bytes >= previous_->rx_bytes) {
                stats.network_rx_bytes_per_sec =
                    static_cast<double>(sample.rx_bytes - previous_->rx_bytes) / seconds;
            }
            if (sample.tx_bytes >= previous_->tx_bytes) {
                stats.network_tx_bytes_per_sec =
                    static_cast<double>(sample.tx_bytes - previous_->tx_bytes) / seconds;
            }
        }
    }

    previous_ = sample;
    return stats;
}

} // namespace docker
} // namespace dtop
