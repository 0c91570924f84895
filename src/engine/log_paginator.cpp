#include <algorithm>
#include <dtop/core/logger.hpp>
#include <dtop/engine/log_paginator.hpp>

namespace dtop {
namespace engine {

std::chrono::nanoseconds initialLookbackWindow(Timestamp batch_oldest, Timestamp batch_newest)
{
    auto span = batch_newest - batch_oldest;
    if (span <= Timestamp::duration::zero()) {
        return FALLBACK_LOOKBACK_WINDOW;
    }

    std::chrono::duration<double, std::nano> scaled =
        std::chrono::duration<double, std::nano>(span) * LOOKBACK_WINDOW_MARGIN;
    return std::chrono::round<std::chrono::nanoseconds>(scaled);
}

std::optional<LogPage> fetchOlderPage(const LogPageRequest& request, const LogRangeFetcher& fetch,
                                      const CancelToken* token)
{
    auto* logger = Logger::getInstance();

    const Timestamp until = request.oldest_loaded;
    const Timestamp lower_bound = request.created.value_or(Timestamp{});
    std::chrono::nanoseconds window = initialLookbackWindow(request.batch_oldest, request.batch_newest);

    while (true) {
        if (token != nullptr && token->isCancelled()) {
            return std::nullopt;
        }

        Timestamp since;
        bool final_fetch = false;
        if (until <= lower_bound || until - lower_bound <= window) {
            since = lower_bound;
            final_fetch = true;
        }
        else {
            since = until - std::chrono::duration_cast<Timestamp::duration>(window);
        }

        std::vector<LogEntry> entries = fetch(since, until);
        entries.erase(std::remove_if(entries.begin(), entries.end(),
                                     [&](const LogEntry& entry) { return entry.timestamp >= until; }),
                      entries.end());

        logger->debug("Older log window of {}s returned {} entries{}",
                      std::chrono::duration_cast<std::chrono::seconds>(window).count(), entries.size(),
                      final_fetch ? " (reached creation time)" : "");

        if (final_fetch) {
            return LogPage{std::move(entries), false};
        }

        if (entries.size() >= request.batch_size) {
            entries.erase(entries.begin(), entries.end() - static_cast<std::ptrdiff_t>(request.batch_size));
            return LogPage{std::move(entries), true};
        }

        window *= 2;
    }
}

} // namespace engine
} // namespace dtop
