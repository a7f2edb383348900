#include "concurrencygate.h"

#include <QDebug>
#include <QMutexLocker>

#include <algorithm>

ConcurrencyGate::ConcurrencyGate(int limit)
    : limit_(std::max(1, limit))
{
}

bool ConcurrencyGate::acquire()
{
    QMutexLocker locker(&mutex_);
    while (!interrupted_ && inUse_ >= limit_) {
        changed_.wait(&mutex_);
    }
    if (interrupted_) {
        return false;
    }

    ++inUse_;
    peakInUse_ = std::max(peakInUse_, inUse_);
    return true;
}

void ConcurrencyGate::release()
{
    QMutexLocker locker(&mutex_);
    if (inUse_ == 0) {
        qWarning() << "ConcurrencyGate: release() without a matching acquire()";
        return;
    }
    --inUse_;
    changed_.wakeAll();
}

void ConcurrencyGate::interrupt()
{
    QMutexLocker locker(&mutex_);
    interrupted_ = true;
    changed_.wakeAll();
}

void ConcurrencyGate::resume()
{
    QMutexLocker locker(&mutex_);
    interrupted_ = false;
}

int ConcurrencyGate::available() const
{
    QMutexLocker locker(&mutex_);
    return limit_ - inUse_;
}

int ConcurrencyGate::inUse() const
{
    QMutexLocker locker(&mutex_);
    return inUse_;
}

int ConcurrencyGate::peakInUse() const
{
    QMutexLocker locker(&mutex_);
    return peakInUse_;
}
