#include "retrypolicy.h"

#include <algorithm>

FixedDelayRetryPolicy::FixedDelayRetryPolicy(int delayMs, int maxAttempts)
    : delayMs_(std::max(0, delayMs))
    , maxAttempts_(std::max(0, maxAttempts))
{
}

std::optional<int> FixedDelayRetryPolicy::nextDelayMs(const UploadDescriptor &descriptor,
                                                      int failedAttempt) const
{
    Q_UNUSED(descriptor)
    if (maxAttempts_ > 0 && failedAttempt >= maxAttempts_) {
        return std::nullopt;
    }
    return delayMs_;
}
