#pragma once

#include <chrono>
#include <dtop/core/task.hpp>
#include <dtop/core/types.hpp>
#include <dtop/engine/services.hpp>
#include <functional>
#include <optional>
#include <vector>

namespace dtop {
namespace engine {

// Look-back window used when the loaded batch has no usable time span
constexpr std::chrono::minutes FALLBACK_LOOKBACK_WINDOW{5};

// Margin applied to the loaded batch's span when sizing the first window
constexpr double LOOKBACK_WINDOW_MARGIN = 1.2;

/**
 * @brief Reads the log entries timestamped within [since, until]
 */
using LogRangeFetcher = std::function<std::vector<LogEntry>(Timestamp since, Timestamp until)>;

struct LogPage {
    std::vector<LogEntry> entries; // oldest first, all older than the oldest loaded entry
    bool has_more_history = false;
};

/**
 * @brief First look-back window: the batch span times 1.2, or five minutes
 * when the span is zero or negative
 */
std::chrono::nanoseconds initialLookbackWindow(Timestamp batch_oldest, Timestamp batch_newest);

/**
 * @brief Fetch the page of history just before request.oldest_loaded
 *
 * The window grows by doubling until a fetch returns at least batch_size
 * entries (the most recent batch_size are kept) or reaches the container's
 * creation time (the Unix epoch when unknown), which makes the page final.
 *
 * @return nullopt if the token was cancelled between fetches
 */
std::optional<LogPage> fetchOlderPage(const LogPageRequest& request, const LogRangeFetcher& fetch,
                                      const CancelToken* token = nullptr);

} // namespace engine
} // namespace dtop
