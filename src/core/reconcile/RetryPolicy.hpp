#pragma once

namespace rsb {

/// Bounded exponential backoff.
///
/// attempt numbers are 1-based: attempt 1 is the initial call and never
/// waits. delayBefore(n) is the pause before attempt n (n >= 2), capped at
/// maxDelayMs. Returns -1 once the attempt budget is spent.
struct RetryPolicy {
    int maxAttempts = 3;
    int initialDelayMs = 500;
    double multiplier = 2.0;
    int maxDelayMs = 8000;

    bool canRetry(int attemptsMade) const { return attemptsMade < maxAttempts; }
    int delayBefore(int attempt) const;
};

} // namespace rsb
