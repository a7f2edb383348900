#include "workqueue.h"

#include <QMutexLocker>

void WorkQueue::enqueue(const QueueEntry &entry)
{
    QMutexLocker locker(&mutex_);
    ready_.enqueue(entry);
    notEmpty_.wakeOne();
}

void WorkQueue::enqueueAfter(const QueueEntry &entry, int delayMs)
{
    if (delayMs <= 0) {
        enqueue(entry);
        return;
    }

    QMutexLocker locker(&mutex_);
    DelayedEntry delayed{entry, QDeadlineTimer(delayMs)};

    // Keep delayed_ ordered by due time; equal deadlines stay in arrival order
    auto it = delayed_.begin();
    while (it != delayed_.end() && it->due.deadlineNSecs() <= delayed.due.deadlineNSecs()) {
        ++it;
    }
    delayed_.insert(it, delayed);

    // A blocked taker may be sleeping until a later deadline
    notEmpty_.wakeAll();
}

void WorkQueue::requeueFront(const QueueEntry &entry)
{
    QMutexLocker locker(&mutex_);
    ready_.prepend(entry);
    notEmpty_.wakeOne();
}

bool WorkQueue::take(QueueEntry *out)
{
    QMutexLocker locker(&mutex_);

    while (true) {
        if (interrupted_) {
            return false;
        }

        admitDueEntries();
        if (!ready_.isEmpty()) {
            *out = ready_.dequeue();
            return true;
        }

        if (delayed_.isEmpty()) {
            notEmpty_.wait(&mutex_);
        } else {
            notEmpty_.wait(&mutex_, nextDue());
        }
    }
}

void WorkQueue::interrupt()
{
    QMutexLocker locker(&mutex_);
    interrupted_ = true;
    notEmpty_.wakeAll();
}

void WorkQueue::resume()
{
    QMutexLocker locker(&mutex_);
    interrupted_ = false;
}

int WorkQueue::readyCount() const
{
    QMutexLocker locker(&mutex_);
    return ready_.size();
}

int WorkQueue::delayedCount() const
{
    QMutexLocker locker(&mutex_);
    return delayed_.size();
}

bool WorkQueue::isEmpty() const
{
    QMutexLocker locker(&mutex_);
    return ready_.isEmpty() && delayed_.isEmpty();
}

void WorkQueue::admitDueEntries()
{
    while (!delayed_.isEmpty() && delayed_.first().due.hasExpired()) {
        ready_.enqueue(delayed_.takeFirst().entry);
    }
}

QDeadlineTimer WorkQueue::nextDue() const
{
    return delayed_.first().due;
}
