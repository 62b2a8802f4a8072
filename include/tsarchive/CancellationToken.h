/**
 * CancellationToken.h - Shared cooperative cancellation flag
 *
 * Observed at task boundaries and by blocking waits; never interrupts a
 * call already in progress.
 */

#pragma once

#include <atomic>

class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};
