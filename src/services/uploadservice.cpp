#include "uploadservice.h"
#include "errorhandler.h"
#include "utils/logging.h"

#include <QDeadlineTimer>
#include <QDir>
#include <QMutexLocker>

DuplicateUploadError::DuplicateUploadError(const QString &id)
    : std::logic_error(QString("Upload already pending for id %1").arg(id).toStdString())
    , id_(id)
{
}

UploadService::UploadService(int limit,
                             IRemoteStore *store,
                             IUploadListener *listener,
                             QObject *parent)
    : QObject(parent)
    , store_(store)
    , listener_(listener)
    , errorHandler_(new ErrorHandler(this))
    , gate_(limit)
    , retryPolicy_(std::make_shared<FixedDelayRetryPolicy>())
{
    Q_ASSERT(store_ && "IRemoteStore is required");
    Q_ASSERT(listener_ && "IUploadListener is required");

    // The gate bounds concurrency; the pool only needs a thread per slot
    workers_.setMaxThreadCount(gate_.limit());
}

UploadService::~UploadService()
{
    stop();
    workers_.waitForDone();
}

void UploadService::setRetryPolicy(std::shared_ptr<RetryPolicy> policy)
{
    if (!policy) {
        return;
    }
    QMutexLocker locker(&configMutex_);
    retryPolicy_ = std::move(policy);
}

QString UploadService::stagingDirectory() const
{
    QMutexLocker locker(&configMutex_);
    return descriptors_.directory();
}

DescriptorStore UploadService::descriptorStore() const
{
    QMutexLocker locker(&configMutex_);
    return descriptors_;
}

int UploadService::recover(const QString &cacheRoot)
{
    const QString stagingDir = QDir::cleanPath(QDir(cacheRoot).filePath(QLatin1String(UploadFolder)));

    {
        QMutexLocker locker(&configMutex_);
        if (descriptors_.directory() == stagingDir) {
            return 0;
        }

        if (!QDir().mkpath(stagingDir)) {
            errorHandler_->handleStorageError(tr("Create staging directory %1").arg(stagingDir),
                                              tr("Could not create directory"));
            return 0;
        }

        LOG_VERBOSE() << "UploadService: Staging directory changed from"
                      << descriptors_.directory() << "to" << stagingDir;
        descriptors_.setDirectory(stagingDir);
    }

    DescriptorStore::ScanResult scan = descriptorStore().scan();

    for (const QString &record : scan.corruptRecords) {
        errorHandler_->handleError(ErrorCategory::Recovery,
                                   ErrorSeverity::Warning,
                                   tr("Skipped unreadable descriptor"),
                                   record);
    }

    if (scan.descriptors.isEmpty()) {
        return 0;
    }

    qWarning().noquote() << QString("UploadService: %1 not uploaded files found. Resuming.")
                                .arg(scan.descriptors.size());

    for (const StoredDescriptor &stored : scan.descriptors) {
        const UploadDescriptor &descriptor = stored.descriptor;
        if (!stored.payloadExists) {
            errorHandler_->handleError(ErrorCategory::Recovery,
                                       ErrorSeverity::Warning,
                                       tr("Staged file missing for %1").arg(descriptor.path),
                                       stored.recordPath);
        }

        UploadingItem item;
        item.path = descriptor.path;
        item.id = descriptor.id;
        item.parentId = descriptor.parentId;
        item.length = stored.payloadSize;
        listener_->onUploadResumed(item);

        admit(QueueEntry{descriptor, 1, stagingDir});
    }

    return scan.descriptors.size();
}

bool UploadService::submitNew(const UploadDescriptor &descriptor)
{
    return submit(descriptor, false);
}

bool UploadService::submitOverwrite(const UploadDescriptor &descriptor)
{
    return submit(descriptor, true);
}

bool UploadService::validateIntake(const DescriptorStore &store, const UploadDescriptor &descriptor)
{
    if (!store.hasDirectory()) {
        errorHandler_->handleError(ErrorCategory::Validation,
                                   ErrorSeverity::Critical,
                                   tr("Upload rejected: %1").arg(descriptor.path),
                                   tr("No staging directory configured"));
        return false;
    }
    if (!DescriptorStore::isValidId(descriptor.id)) {
        errorHandler_->handleError(ErrorCategory::Validation,
                                   ErrorSeverity::Critical,
                                   tr("Upload rejected: %1").arg(descriptor.path),
                                   tr("Invalid id \"%1\"").arg(descriptor.id));
        return false;
    }
    return true;
}

bool UploadService::submit(UploadDescriptor descriptor, bool overwrite)
{
    descriptor.overwrite = overwrite;

    DescriptorStore store = descriptorStore();
    if (!validateIntake(store, descriptor)) {
        return false;
    }

    // The existence check and the commit must not interleave for one id
    QMutexLocker intakeLocker(&intakeMutex_);
    descriptor.created = DescriptorStore::nextIntakeKey();

    QString error;
    switch (store.write(descriptor, &error)) {
    case DescriptorStore::WriteResult::Written:
        break;
    case DescriptorStore::WriteResult::AlreadyExists:
        throw DuplicateUploadError(descriptor.id);
    case DescriptorStore::WriteResult::Failed:
        errorHandler_->handleStorageError(tr("Write descriptor for %1").arg(descriptor.path), error);
        return false;
    }

    LOG_VERBOSE() << "UploadService: Queued" << (overwrite ? "overwrite:" : "upload:")
                  << descriptor.path;
    admit(QueueEntry{descriptor, 1, store.directory()});
    return true;
}

std::unique_ptr<StagedFileWriter> UploadService::openNew(const UploadDescriptor &descriptor)
{
    return openWriter(descriptor, false);
}

std::unique_ptr<StagedFileWriter> UploadService::openTruncate(const UploadDescriptor &descriptor)
{
    return openWriter(descriptor, true);
}

std::unique_ptr<StagedFileWriter> UploadService::openWriter(const UploadDescriptor &descriptor,
                                                            bool overwrite)
{
    DescriptorStore store = descriptorStore();
    if (!validateIntake(store, descriptor)) {
        return nullptr;
    }

    auto writer = std::make_unique<StagedFileWriter>(
        store.payloadPath(descriptor.id),
        [this, descriptor, overwrite](qint64 finalLength) {
            UploadDescriptor finished = descriptor;
            finished.length = finalLength;
            return overwrite ? submitOverwrite(finished) : submitNew(finished);
        });

    if (!writer->open(overwrite)) {
        errorHandler_->handleStorageError(tr("Open staged file %1").arg(writer->path()),
                                          writer->errorString());
        return nullptr;
    }
    return writer;
}

void UploadService::admit(const QueueEntry &entry)
{
    {
        QMutexLocker locker(&idleMutex_);
        ++outstanding_;
    }
    queue_.enqueue(entry);
}

void UploadService::start()
{
    QMutexLocker locker(&lifecycleMutex_);
    if (dispatcher_) {
        return;
    }

    dispatcher_.reset(QThread::create([this]() { dispatchLoop(); }));
    dispatcher_->setObjectName(QStringLiteral("UploadDispatcher"));
    dispatcher_->start();
    LOG_VERBOSE() << "UploadService: Dispatcher started, limit" << gate_.limit();
}

void UploadService::stop()
{
    QMutexLocker locker(&lifecycleMutex_);
    if (!dispatcher_) {
        return;
    }

    queue_.interrupt();
    gate_.interrupt();
    dispatcher_->wait();
    dispatcher_.reset();

    // Leave the primitives usable for the next start()
    queue_.resume();
    gate_.resume();
    LOG_VERBOSE() << "UploadService: Dispatcher stopped";
}

bool UploadService::isRunning() const
{
    QMutexLocker locker(&lifecycleMutex_);
    return dispatcher_ != nullptr;
}

bool UploadService::waitForIdle(int timeoutMs)
{
    QDeadlineTimer deadline = timeoutMs < 0 ? QDeadlineTimer(QDeadlineTimer::Forever)
                                            : QDeadlineTimer(timeoutMs);
    QMutexLocker locker(&idleMutex_);
    while (outstanding_ > 0) {
        if (!idleChanged_.wait(&idleMutex_, deadline)) {
            return outstanding_ == 0;
        }
    }
    return true;
}

int UploadService::pendingCount() const
{
    QMutexLocker locker(&idleMutex_);
    return outstanding_;
}

int UploadService::queuedCount() const
{
    return queue_.readyCount() + queue_.delayedCount();
}

void UploadService::dispatchLoop()
{
    QueueEntry entry;
    while (queue_.take(&entry)) {
        if (!gate_.acquire()) {
            // Stopped while waiting for a slot; keep the entry's place
            queue_.requeueFront(entry);
            break;
        }

        LOG_VERBOSE() << "UploadService: Dispatching" << entry.descriptor.path
                      << "active" << gate_.inUse() << "/" << gate_.limit();
        workers_.start([this, entry]() { runTransfer(entry); });
    }
}

void UploadService::runTransfer(const QueueEntry &entry)
{
    // Bound to the directory the entry was admitted from, even if recover() moved on
    DescriptorStore store(entry.stagingDirectory);
    UploadExecutor executor(entry, store_, store.payloadPath(entry.descriptor.id));
    const TransferOutcome &outcome = executor.run();
    completeTransfer(entry, outcome, store);
}

void UploadService::completeTransfer(const QueueEntry &entry,
                                     const TransferOutcome &outcome,
                                     DescriptorStore &store)
{
    const UploadDescriptor &descriptor = entry.descriptor;

    switch (outcome.state) {
    case TransferState::Succeeded:
        removeDescriptor(store, descriptor);
        if (outcome.resolvedByConflict) {
            qWarning().noquote() << "UploadService: Upload conflict resolved to existing file:"
                                 << descriptor.path;
        }
        listener_->onUploadFinished(descriptor, *outcome.node);
        gate_.release();
        resolveItem();
        return;

    case TransferState::PermanentlyFailed:
        removeDescriptor(store, descriptor);
        listener_->onUploadFailed(descriptor, outcome.reason);
        if (outcome.unexpected) {
            errorHandler_->handleUnexpected(outcome.error);
            emit unexpectedCondition(descriptor.id, outcome.error);
        } else {
            errorHandler_->handleError(ErrorCategory::Transfer,
                                       ErrorSeverity::Warning,
                                       tr("Upload abandoned: %1").arg(descriptor.path),
                                       QString("%1: %2").arg(QLatin1String(failReasonToString(outcome.reason)),
                                                             outcome.error));
        }
        gate_.release();
        resolveItem();
        return;

    case TransferState::RetryableFailed:
        gate_.release();
        scheduleRetry(entry, outcome.error, store);
        return;

    case TransferState::Pending:
    case TransferState::InFlight:
        break;
    }

    // run() always ends in one of the states above
    errorHandler_->handleUnexpected(QString("Transfer of %1 ended in state %2")
                                        .arg(descriptor.path,
                                             QLatin1String(transferStateToString(outcome.state))));
    gate_.release();
    scheduleRetry(entry, outcome.error, store);
}

void UploadService::scheduleRetry(const QueueEntry &entry, const QString &error, DescriptorStore &store)
{
    const UploadDescriptor &descriptor = entry.descriptor;
    errorHandler_->handleTransferError(descriptor.path, error);

    std::shared_ptr<RetryPolicy> policy;
    {
        QMutexLocker locker(&configMutex_);
        policy = retryPolicy_;
    }

    std::optional<int> delayMs = policy->nextDelayMs(descriptor, entry.attempt);
    if (!delayMs) {
        removeDescriptor(store, descriptor);
        listener_->onUploadFailed(descriptor, FailReason::RetryLimitReached);
        errorHandler_->handleError(ErrorCategory::Transfer,
                                   ErrorSeverity::Critical,
                                   tr("Upload abandoned: %1").arg(descriptor.path),
                                   tr("Gave up after %1 attempts").arg(entry.attempt));
        resolveItem();
        return;
    }

    QueueEntry retry = entry;
    retry.attempt = entry.attempt + 1;
    emit retryScheduled(descriptor.id, retry.attempt, *delayMs);
    queue_.enqueueAfter(retry, *delayMs);
}

void UploadService::resolveItem()
{
    QMutexLocker locker(&idleMutex_);
    --outstanding_;
    if (outstanding_ <= 0) {
        outstanding_ = 0;
        idleChanged_.wakeAll();
    }
}

void UploadService::removeDescriptor(DescriptorStore &store, const UploadDescriptor &descriptor)
{
    QString error;
    if (!store.remove(descriptor.id, &error)) {
        errorHandler_->handleStorageError(tr("Remove descriptor for %1").arg(descriptor.path), error);
    }
}
