/**
 * @file uploadservice.h
 * @brief Persistent, crash-recoverable upload queue.
 *
 * The service accepts staged files, persists a descriptor for each before
 * intake returns, and uploads them to the remote store with at most
 * `limit` transfers in flight. Descriptors left over by a previous run are
 * resumed by recover().
 */

#ifndef UPLOADSERVICE_H
#define UPLOADSERVICE_H

#include <QMutex>
#include <QObject>
#include <QString>
#include <QThread>
#include <QThreadPool>
#include <QWaitCondition>

#include <memory>
#include <stdexcept>

#include "models/concurrencygate.h"
#include "models/uploaddescriptor.h"
#include "models/workqueue.h"
#include "services/descriptorstore.h"
#include "services/iremotestore.h"
#include "services/iuploadlistener.h"
#include "services/retrypolicy.h"
#include "services/stagedfilewriter.h"
#include "services/uploadexecutor.h"

class ErrorHandler;

/**
 * @brief Raised when intake finds a descriptor already pending for an id.
 *
 * This signals a bug in the intake layer, not a runtime condition, and is
 * never caught by the service.
 */
class DuplicateUploadError : public std::logic_error
{
public:
    explicit DuplicateUploadError(const QString &id);

    [[nodiscard]] QString id() const { return id_; }

private:
    QString id_;
};

/**
 * @brief Upload queue with durable intake and bounded concurrency.
 *
 * Work flows Intake -> descriptor on disk -> WorkQueue -> dispatcher
 * (+ ConcurrencyGate) -> UploadExecutor on the worker pool -> listener.
 * Retryable failures return to the WorkQueue after the retry policy's
 * delay and are never reported to the listener.
 *
 * Threading:
 * - one dispatcher thread while running; it only blocks in the queue take
 *   and the gate acquire, and both are interrupted by stop()
 * - up to `limit` transfers on a private worker pool; an in-flight transfer
 *   is never interrupted and runs to its outcome even after stop()
 * - listener callbacks and the signals below are invoked on the worker
 *   thread handling the item (recovery callbacks on the recover() caller)
 *
 * @par Example usage:
 * @code
 * UploadService service(2, store, listener);
 * service.recover(cacheRoot);   // resumes pending work from a previous run
 * service.start();
 *
 * std::unique_ptr<StagedFileWriter> writer = service.openNew(descriptor);
 * writer->write(bytes);
 * writer->close();              // descriptor persisted, upload queued
 *
 * service.waitForIdle();
 * service.stop();
 * @endcode
 */
class UploadService : public QObject
{
    Q_OBJECT

public:
    /// Subdirectory of the cache root holding payloads and descriptors
    static constexpr const char *UploadFolder = "Upload";

    /**
     * @brief Constructs an upload service.
     * @param limit Maximum concurrent transfers (values below 1 are treated as 1).
     * @param store The remote store (not owned).
     * @param listener Receives outcomes (not owned).
     * @param parent Optional parent QObject for memory management.
     */
    UploadService(int limit,
                  IRemoteStore *store,
                  IUploadListener *listener,
                  QObject *parent = nullptr);

    /**
     * @brief Stops the dispatcher and waits for in-flight transfers.
     *
     * Entries still queued or waiting for a retry are dropped from memory;
     * their descriptors stay on disk for the next recover().
     */
    ~UploadService() override;

    /// @name Configuration
    /// @{

    /**
     * @brief Replaces the retry policy.
     *
     * Defaults to FixedDelayRetryPolicy (5 s, unlimited attempts).
     */
    void setRetryPolicy(std::shared_ptr<RetryPolicy> policy);

    /**
     * @brief Returns the handler all absorbed errors are reported to.
     */
    [[nodiscard]] ErrorHandler *errorHandler() const { return errorHandler_; }

    [[nodiscard]] int limit() const { return gate_.limit(); }

    /**
     * @brief Returns the staging directory, empty before recover().
     */
    [[nodiscard]] QString stagingDirectory() const;
    /// @}

    /// @name Recovery
    /// @{

    /**
     * @brief Configures the staging directory and resumes leftover work.
     * @param cacheRoot Cache root; the staging directory is its UploadFolder.
     * @return Number of resumed uploads.
     *
     * Every descriptor found is reported through onUploadResumed() and
     * re-admitted in the order the descriptors were created. Unreadable
     * descriptors are set aside and reported to the error handler.
     * Recovering the current staging directory again does nothing.
     * Switching to another directory only affects new intake; uploads
     * already admitted finish against the directory they came from.
     */
    int recover(const QString &cacheRoot);
    /// @}

    /// @name Intake
    /// @{

    /**
     * @brief Queues a staged file to be created remotely.
     * @return False if the upload was rejected (no staging directory,
     *         invalid id, descriptor I/O error).
     * @throws DuplicateUploadError if the id already has a pending upload.
     */
    bool submitNew(const UploadDescriptor &descriptor);

    /**
     * @brief Queues a staged file to replace remote object descriptor.id.
     * @return False if the upload was rejected.
     * @throws DuplicateUploadError if the id already has a pending upload.
     */
    bool submitOverwrite(const UploadDescriptor &descriptor);

    /**
     * @brief Opens a writer for a new file; close() calls submitNew().
     * @return The writer, or nullptr if the payload cannot be opened.
     *
     * The final length is taken from the staged bytes at close().
     * Writers must be closed or destroyed before the service.
     */
    [[nodiscard]] std::unique_ptr<StagedFileWriter> openNew(const UploadDescriptor &descriptor);

    /**
     * @brief Opens a truncated writer; close() calls submitOverwrite().
     * @return The writer, or nullptr if the payload cannot be opened.
     */
    [[nodiscard]] std::unique_ptr<StagedFileWriter> openTruncate(const UploadDescriptor &descriptor);
    /// @}

    /// @name Lifecycle
    /// @{

    /**
     * @brief Starts the dispatcher. Does nothing if already running.
     */
    void start();

    /**
     * @brief Stops the dispatcher.
     *
     * Returns once the dispatcher has left its blocking point. Does not wait
     * for in-flight transfers. start() may be called again afterwards.
     */
    void stop();

    [[nodiscard]] bool isRunning() const;

    /**
     * @brief Blocks until every admitted upload has been resolved.
     * @param timeoutMs Maximum wait, -1 waits forever.
     * @return True if the queue is empty and no transfer is in flight.
     */
    bool waitForIdle(int timeoutMs = -1);
    /// @}

    /// @name Queue State
    /// @{

    /// @brief Admitted uploads not yet resolved (queued, retrying or in flight).
    [[nodiscard]] int pendingCount() const;

    /// @brief Entries waiting in the work queue, including parked retries.
    [[nodiscard]] int queuedCount() const;

    /// @brief Transfers currently holding a concurrency slot.
    [[nodiscard]] int activeCount() const { return gate_.inUse(); }

    /// @brief Most transfers that were in flight at once.
    [[nodiscard]] int peakActiveCount() const { return gate_.peakInUse(); }
    /// @}

signals:
    /**
     * @brief Emitted when the remote store misbehaved for an item.
     * @param id The upload id.
     * @param message Description of the condition.
     *
     * The item has also been reported through onUploadFailed().
     */
    void unexpectedCondition(const QString &id, const QString &message);

    /**
     * @brief Emitted when a retryable failure is scheduled for another attempt.
     * @param id The upload id.
     * @param attempt Number of the upcoming attempt.
     * @param delayMs Delay before re-admission.
     */
    void retryScheduled(const QString &id, int attempt, int delayMs);

private:
    bool submit(UploadDescriptor descriptor, bool overwrite);
    std::unique_ptr<StagedFileWriter> openWriter(const UploadDescriptor &descriptor, bool overwrite);
    [[nodiscard]] bool validateIntake(const DescriptorStore &store, const UploadDescriptor &descriptor);
    [[nodiscard]] DescriptorStore descriptorStore() const;

    void admit(const QueueEntry &entry);
    void dispatchLoop();
    void runTransfer(const QueueEntry &entry);
    void completeTransfer(const QueueEntry &entry, const TransferOutcome &outcome,
                          DescriptorStore &store);
    void scheduleRetry(const QueueEntry &entry, const QString &error, DescriptorStore &store);
    void resolveItem();
    void removeDescriptor(DescriptorStore &store, const UploadDescriptor &descriptor);

    IRemoteStore *store_ = nullptr;
    IUploadListener *listener_ = nullptr;
    ErrorHandler *errorHandler_ = nullptr;

    WorkQueue queue_;
    ConcurrencyGate gate_;
    QThreadPool workers_;

    QMutex intakeMutex_;

    mutable QMutex configMutex_;
    DescriptorStore descriptors_;
    std::shared_ptr<RetryPolicy> retryPolicy_;

    mutable QMutex lifecycleMutex_;
    std::unique_ptr<QThread> dispatcher_;

    mutable QMutex idleMutex_;
    QWaitCondition idleChanged_;
    int outstanding_ = 0;
};

#endif // UPLOADSERVICE_H
