/**
 * RateLimiter.h - Process-wide request throttle shared by every fetch
 *
 * Two limits apply to each grant:
 *  - a minimum spacing since the previous grant;
 *  - a rolling-window payload budget: the bytes granted over the trailing
 *    window never exceed the configured cap.
 *
 * Callers are served strictly in arrival order. The limiter is an explicit
 * object handed to its users (typically via std::shared_ptr).
 */

#pragma once

#include "tsarchive/CancellationToken.h"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

struct RateLimitConfig {
    std::chrono::milliseconds min_spacing{5000};
    std::chrono::milliseconds rolling_window{60000};
    size_t payload_cap_bytes = 64 * 1024 * 1024;
};

class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    struct Grant {
        uint64_t id = 0;
        size_t bytes = 0;
        Clock::time_point granted_at;
    };

    /**
     * @throws std::invalid_argument if the window is not positive or the cap is zero.
     */
    explicit RateLimiter(const RateLimitConfig& config = RateLimitConfig());

    /**
     * @brief Block until a request of the given size may be issued.
     * @param estimated_bytes Expected payload size of the request.
     * @param cancel Checked while waiting.
     * @throws QuotaExceededError if the size can never fit in the rolling budget.
     * @throws CancellationError if cancel fires while waiting.
     */
    Grant acquire(size_t estimated_bytes, const CancellationToken& cancel);

    /**
     * @brief Account a grant at its observed payload if that is larger than
     *        the estimate, so later grants see the real consumption.
     */
    void settle(const Grant& grant, size_t actual_bytes);

    void reconfigure(const RateLimitConfig& config);
    RateLimitConfig get_config() const;

    size_t waiting() const;
    json stats() const;

private:
    struct WindowEntry {
        uint64_t id;
        Clock::time_point at;
        size_t bytes;
    };

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    RateLimitConfig config_;

    std::deque<uint64_t> queue_;
    uint64_t next_ticket_ = 0;
    uint64_t next_grant_id_ = 1;

    std::deque<WindowEntry> window_;
    std::optional<Clock::time_point> last_grant_;

    uint64_t grants_total_ = 0;
    uint64_t bytes_granted_total_ = 0;
    uint64_t quota_rejections_ = 0;
    uint64_t cancellations_ = 0;

    static void validate(const RateLimitConfig& config);
    void prune(Clock::time_point now);
    size_t window_bytes() const;
    Clock::time_point earliest_permitted(size_t bytes, Clock::time_point now) const;
    void leave_queue(uint64_t ticket);
};
