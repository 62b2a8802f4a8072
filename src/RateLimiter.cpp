/**
 * RateLimiter.cpp - Implementation
 */

#include "tsarchive/RateLimiter.h"
#include "tsarchive/ArchiveTypes.h"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace {
    // Waiters re-check cancellation at this cadence.
    constexpr auto POLL_INTERVAL = std::chrono::milliseconds(100);
}

RateLimiter::RateLimiter(const RateLimitConfig& config) : config_(config) {
    validate(config_);
}

void RateLimiter::validate(const RateLimitConfig& config) {
    if (config.rolling_window.count() <= 0) {
        throw std::invalid_argument("Rate limiter rolling window must be positive");
    }
    if (config.payload_cap_bytes == 0) {
        throw std::invalid_argument("Rate limiter payload cap must be positive");
    }
    if (config.min_spacing.count() < 0) {
        throw std::invalid_argument("Rate limiter spacing must not be negative");
    }
}

void RateLimiter::prune(Clock::time_point now) {
    while (!window_.empty() && window_.front().at + config_.rolling_window <= now) {
        window_.pop_front();
    }
}

size_t RateLimiter::window_bytes() const {
    size_t total = 0;
    for (const auto& entry : window_) total += entry.bytes;
    return total;
}

RateLimiter::Clock::time_point RateLimiter::earliest_permitted(size_t bytes, Clock::time_point now) const {
    Clock::time_point permitted = now;

    if (last_grant_) {
        permitted = std::max(permitted, *last_grant_ + config_.min_spacing);
    }

    size_t used = window_bytes();
    if (used + bytes > config_.payload_cap_bytes) {
        // Walk forward until enough old grants have aged out of the window.
        size_t freed = 0;
        for (const auto& entry : window_) {
            freed += entry.bytes;
            if (used - freed + bytes <= config_.payload_cap_bytes) {
                permitted = std::max(permitted, entry.at + config_.rolling_window);
                break;
            }
        }
    }
    return permitted;
}

void RateLimiter::leave_queue(uint64_t ticket) {
    auto it = std::find(queue_.begin(), queue_.end(), ticket);
    if (it != queue_.end()) queue_.erase(it);
    cv_.notify_all();
}

RateLimiter::Grant RateLimiter::acquire(size_t estimated_bytes, const CancellationToken& cancel) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (estimated_bytes > config_.payload_cap_bytes) {
        ++quota_rejections_;
        throw QuotaExceededError("Request of " + std::to_string(estimated_bytes) +
                                 " bytes exceeds rolling budget of " +
                                 std::to_string(config_.payload_cap_bytes) + " bytes");
    }

    const uint64_t ticket = next_ticket_++;
    queue_.push_back(ticket);

    while (true) {
        if (cancel.is_cancelled()) {
            ++cancellations_;
            leave_queue(ticket);
            throw CancellationError();
        }

        // The cap may have shrunk while this caller was queued.
        if (estimated_bytes > config_.payload_cap_bytes) {
            ++quota_rejections_;
            leave_queue(ticket);
            throw QuotaExceededError("Request of " + std::to_string(estimated_bytes) +
                                     " bytes exceeds rolling budget of " +
                                     std::to_string(config_.payload_cap_bytes) + " bytes");
        }

        if (queue_.front() != ticket) {
            cv_.wait_for(lock, POLL_INTERVAL);
            continue;
        }

        auto now = Clock::now();
        prune(now);
        auto permitted = earliest_permitted(estimated_bytes, now);
        if (permitted <= now) {
            Grant grant;
            grant.id = next_grant_id_++;
            grant.bytes = estimated_bytes;
            grant.granted_at = now;

            window_.push_back(WindowEntry{grant.id, now, estimated_bytes});
            last_grant_ = now;
            ++grants_total_;
            bytes_granted_total_ += estimated_bytes;

            queue_.pop_front();
            cv_.notify_all();
            return grant;
        }

        cv_.wait_until(lock, std::min(permitted, now + POLL_INTERVAL));
    }
}

void RateLimiter::settle(const Grant& grant, size_t actual_bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : window_) {
        if (entry.id == grant.id) {
            if (actual_bytes > entry.bytes) {
                bytes_granted_total_ += actual_bytes - entry.bytes;
                entry.bytes = actual_bytes;
            }
            break;
        }
    }
}

void RateLimiter::reconfigure(const RateLimitConfig& config) {
    validate(config);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config_ = config;
    }
    cv_.notify_all();
}

RateLimitConfig RateLimiter::get_config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

size_t RateLimiter::waiting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

json RateLimiter::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    size_t in_window = 0;
    for (const auto& entry : window_) {
        if (entry.at + config_.rolling_window > now) in_window += entry.bytes;
    }
    return json{
        {"min_spacing_ms", config_.min_spacing.count()},
        {"rolling_window_ms", config_.rolling_window.count()},
        {"payload_cap_bytes", config_.payload_cap_bytes},
        {"window_bytes", in_window},
        {"waiting", queue_.size()},
        {"grants_total", grants_total_},
        {"bytes_granted_total", bytes_granted_total_},
        {"quota_rejections", quota_rejections_},
        {"cancellations", cancellations_}
    };
}
