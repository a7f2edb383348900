/**
 * @file workqueue.h
 * @brief Unbounded, thread-safe FIFO of upload entries.
 */

#ifndef WORKQUEUE_H
#define WORKQUEUE_H

#include <QDeadlineTimer>
#include <QList>
#include <QMutex>
#include <QQueue>
#include <QWaitCondition>

#include "uploaddescriptor.h"

/**
 * @brief Blocking FIFO queue feeding the upload dispatcher.
 *
 * Entries come out in the order they were admitted. Besides immediate
 * admission the queue can park an entry for a delay; a parked entry is
 * appended to the tail once its delay has elapsed, so a retry never holds
 * a worker thread while it waits.
 *
 * take() is the only blocking call. interrupt() wakes every blocked taker
 * and makes take() return false until resume() is called.
 *
 * @par Example usage:
 * @code
 * WorkQueue queue;
 * queue.enqueue({descriptor, 1});
 *
 * QueueEntry entry;
 * while (queue.take(&entry)) {
 *     // dispatch entry
 * }
 * @endcode
 */
class WorkQueue
{
public:
    WorkQueue() = default;
    ~WorkQueue() = default;

    WorkQueue(const WorkQueue &) = delete;
    WorkQueue &operator=(const WorkQueue &) = delete;

    /**
     * @brief Appends an entry to the tail of the queue.
     */
    void enqueue(const QueueEntry &entry);

    /**
     * @brief Parks an entry and admits it to the tail after delayMs.
     *
     * A non-positive delay admits immediately.
     */
    void enqueueAfter(const QueueEntry &entry, int delayMs);

    /**
     * @brief Puts an entry back at the head of the queue.
     *
     * Used when an entry was taken but could not be dispatched, so it keeps
     * its place in admission order.
     */
    void requeueFront(const QueueEntry &entry);

    /**
     * @brief Removes the head entry, blocking until one is available.
     * @param out Receives the entry.
     * @return False if the queue was interrupted.
     */
    [[nodiscard]] bool take(QueueEntry *out);

    /**
     * @brief Wakes blocked takers; take() fails until resume().
     */
    void interrupt();

    /**
     * @brief Clears the interrupted state.
     */
    void resume();

    /// @brief Entries ready to be taken.
    [[nodiscard]] int readyCount() const;

    /// @brief Entries parked for delayed admission.
    [[nodiscard]] int delayedCount() const;

    /// @brief True when no entry is ready or parked.
    [[nodiscard]] bool isEmpty() const;

private:
    struct DelayedEntry {
        QueueEntry entry;
        QDeadlineTimer due;
    };

    /// Moves parked entries whose delay elapsed to the tail. Caller holds mutex_.
    void admitDueEntries();

    /// Time until the earliest parked entry is due. Caller holds mutex_.
    [[nodiscard]] QDeadlineTimer nextDue() const;

    mutable QMutex mutex_;
    QWaitCondition notEmpty_;
    QQueue<QueueEntry> ready_;
    QList<DelayedEntry> delayed_;  // Sorted by due time
    bool interrupted_ = false;
};

#endif // WORKQUEUE_H
