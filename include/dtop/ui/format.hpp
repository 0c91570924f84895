#pragma once

#include <cstddef>
#include <dtop/core/types.hpp>
#include <string>

namespace dtop {
namespace ui {

/**
 * @brief "512B/s", "1.5KB/s", "2.25MB/s", "1.10GB/s"
 */
std::string formatBytesRate(double bytes_per_sec);

std::string formatPercent(double value);

/**
 * @brief Local-time "YYYY-MM-DD HH:MM:SS" for the log view
 */
std::string formatLogTimestamp(Timestamp timestamp);

/**
 * @brief Cut or pad to exactly width characters
 */
std::string fitWidth(const std::string& text, size_t width);

} // namespace ui
} // namespace dtop
