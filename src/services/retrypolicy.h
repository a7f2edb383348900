/**
 * @file retrypolicy.h
 * @brief Decides when a retryable upload failure is re-admitted.
 */

#ifndef RETRYPOLICY_H
#define RETRYPOLICY_H

#include <optional>

#include "models/uploaddescriptor.h"

/**
 * @brief Strategy for re-admitting uploads after a retryable failure.
 *
 * Implementations must be safe to call from several worker threads.
 */
class RetryPolicy
{
public:
    virtual ~RetryPolicy() = default;

    /**
     * @brief Returns the delay before the next attempt.
     * @param descriptor The upload that failed.
     * @param failedAttempt Number of the attempt that just failed (1-based).
     * @return Delay in milliseconds, or std::nullopt to give up.
     */
    [[nodiscard]] virtual std::optional<int> nextDelayMs(const UploadDescriptor &descriptor,
                                                         int failedAttempt) const = 0;
};

/**
 * @brief Retries after a fixed delay, forever by default.
 */
class FixedDelayRetryPolicy : public RetryPolicy
{
public:
    static constexpr int DefaultDelayMs = 5000;

    /**
     * @param delayMs Delay before every retry.
     * @param maxAttempts Total attempts allowed; 0 means unlimited.
     */
    explicit FixedDelayRetryPolicy(int delayMs = DefaultDelayMs, int maxAttempts = 0);

    [[nodiscard]] std::optional<int> nextDelayMs(const UploadDescriptor &descriptor,
                                                 int failedAttempt) const override;

    [[nodiscard]] int delayMs() const { return delayMs_; }
    [[nodiscard]] int maxAttempts() const { return maxAttempts_; }

private:
    int delayMs_;
    int maxAttempts_;
};

#endif // RETRYPOLICY_H
