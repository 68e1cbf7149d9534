#include "core/reconcile/RetryPolicy.hpp"
#include <algorithm>

namespace rsb {

int RetryPolicy::delayBefore(int attempt) const
{
    if (attempt <= 1)
        return 0;
    if (attempt > maxAttempts)
        return -1;

    double delay = std::max(0, initialDelayMs);
    for (int i = 2; i < attempt; ++i) {
        delay *= std::max(1.0, multiplier);
        if (delay >= maxDelayMs)
            break;
    }
    return static_cast<int>(std::min<double>(delay, std::max(0, maxDelayMs)));
}

} // namespace rsb
