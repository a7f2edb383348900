/**
 * @file concurrencygate.h
 * @brief Counting limiter bounding simultaneous transfers.
 */

#ifndef CONCURRENCYGATE_H
#define CONCURRENCYGATE_H

#include <QMutex>
#include <QWaitCondition>

/**
 * @brief Counting resource limiter with an interruptible acquire.
 *
 * Works like a semaphore initialized to the limit, but a blocked acquire()
 * can be woken by interrupt() so the dispatcher can shut down cleanly.
 * release() is never blocked by interruption; in-flight transfers always
 * return their slot.
 */
class ConcurrencyGate
{
public:
    /**
     * @brief Constructs a gate.
     * @param limit Maximum concurrent holders (values below 1 are treated as 1).
     */
    explicit ConcurrencyGate(int limit);
    ~ConcurrencyGate() = default;

    ConcurrencyGate(const ConcurrencyGate &) = delete;
    ConcurrencyGate &operator=(const ConcurrencyGate &) = delete;

    /**
     * @brief Takes one slot, blocking while none is available.
     * @return False if the gate was interrupted before a slot was taken.
     */
    [[nodiscard]] bool acquire();

    /**
     * @brief Returns one slot.
     */
    void release();

    void interrupt();
    void resume();

    [[nodiscard]] int limit() const { return limit_; }
    [[nodiscard]] int available() const;
    [[nodiscard]] int inUse() const;

    /// @brief Highest number of slots held at once since construction.
    [[nodiscard]] int peakInUse() const;

private:
    const int limit_;
    mutable QMutex mutex_;
    QWaitCondition changed_;
    int inUse_ = 0;
    int peakInUse_ = 0;
    bool interrupted_ = false;
};

#endif // CONCURRENCYGATE_H
