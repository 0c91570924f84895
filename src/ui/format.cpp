#include <cstdio>
#include <ctime>
#include <dtop/ui/format.hpp>

namespace dtop {
namespace ui {

std::string formatBytesRate(double bytes_per_sec)
{
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    char buffer[32];
    if (bytes_per_sec >= GB) {
        std::snprintf(buffer, sizeof(buffer), "%.2fGB/s", bytes_per_sec / GB);
    }
    else if (bytes_per_sec >= MB) {
        std::snprintf(buffer, sizeof(buffer), "%.2fMB/s", bytes_per_sec / MB);
    }
    else if (bytes_per_sec >= KB) {
        std::snprintf(buffer, sizeof(buffer), "%.1fKB/s", bytes_per_sec / KB);
    }
    else {
        std::snprintf(buffer, sizeof(buffer), "%.0fB/s", bytes_per_sec);
    }
    return buffer;
}

std::string formatPercent(double value)
{
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%5.1f%%", value);
    return buffer;
}

std::string formatLogTimestamp(Timestamp timestamp)
{
    std::time_t seconds = std::chrono::system_clock::to_time_t(timestamp);
    std::tm local{};
    localtime_r(&seconds, &local);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
    return buffer;
}

std::string fitWidth(const std::string& text, size_t width)
{
    if (text.size() > width) {
        if (width == 0) {
            return "";
        }
        return text.substr(0, width - 1) + "~";
    }
    return text + std::string(width - text.size(), ' ');
}

} // namespace ui
} // namespace dtop
