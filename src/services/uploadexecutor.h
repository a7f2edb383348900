/**
 * @file uploadexecutor.h
 * @brief Per-item transfer state machine.
 *
 * An UploadExecutor performs one attempt of one upload against the remote
 * store and classifies the result. It has no side effects besides the
 * remote calls; the caller applies the outcome (descriptor removal,
 * notifications, retries).
 */

#ifndef UPLOADEXECUTOR_H
#define UPLOADEXECUTOR_H

#include <QString>

#include <optional>

#include "models/uploaddescriptor.h"
#include "services/iremotestore.h"
#include "services/iuploadlistener.h"

/**
 * @brief States of a single transfer attempt.
 */
enum class TransferState {
    Pending,            ///< Created, not started
    InFlight,           ///< Remote call in progress
    Succeeded,          ///< Content is in the remote store
    PermanentlyFailed,  ///< Given up; no retry
    RetryableFailed     ///< Transient failure; may be re-admitted
};

/// @brief Convert TransferState to string for debugging
[[nodiscard]] inline const char* transferStateToString(TransferState state) {
    switch (state) {
        case TransferState::Pending: return "Pending";
        case TransferState::InFlight: return "InFlight";
        case TransferState::Succeeded: return "Succeeded";
        case TransferState::PermanentlyFailed: return "PermanentlyFailed";
        case TransferState::RetryableFailed: return "RetryableFailed";
    }
    return "Unknown";
}

/**
 * @brief Result of one transfer attempt.
 */
struct TransferOutcome {
    TransferState state = TransferState::Pending;
    std::optional<RemoteNode> node;        ///< Set when Succeeded
    FailReason reason = FailReason::NoNode;  ///< Meaningful when PermanentlyFailed
    bool resolvedByConflict = false;       ///< Succeeded through a conflict lookup
    bool unexpected = false;               ///< Store misbehaved (success without a node)
    bool remoteCalled = false;             ///< Whether any remote call was made
    QString error;                         ///< Error text for failed states

    [[nodiscard]] bool isTerminal() const
    {
        return state == TransferState::Succeeded || state == TransferState::PermanentlyFailed;
    }
};

/**
 * @brief Runs one attempt of one upload.
 *
 * Transitions: Pending -> InFlight -> {Succeeded, PermanentlyFailed,
 * RetryableFailed}. run() may be called once; later calls return the
 * recorded outcome.
 *
 * Classification:
 * - length 0: PermanentlyFailed(ZeroLength), no remote call
 * - payload missing: PermanentlyFailed(MissingPayload), no remote call
 * - Ok with node: Succeeded
 * - Ok without node: PermanentlyFailed(NoNode), flagged unexpected
 * - Conflict: lookupChild() decides; found is Succeeded, absent is
 *   PermanentlyFailed(Conflict), a lookup error is RetryableFailed
 * - anything else: RetryableFailed
 */
class UploadExecutor
{
public:
    /**
     * @brief Constructs an executor for one attempt.
     * @param entry The admitted upload.
     * @param store The remote store (not owned).
     * @param payloadPath Path of the staged bytes.
     */
    UploadExecutor(const QueueEntry &entry, IRemoteStore *store, const QString &payloadPath);

    /**
     * @brief Performs the attempt.
     * @return The classified outcome.
     */
    const TransferOutcome &run();

    [[nodiscard]] TransferState state() const { return outcome_.state; }
    [[nodiscard]] const TransferOutcome &outcome() const { return outcome_; }
    [[nodiscard]] const QueueEntry &entry() const { return entry_; }

private:
    void transferPayload();
    void resolveConflict(const RemoteReply &conflictReply);

    void succeed(const RemoteNode &node, bool viaConflict);
    void failPermanently(FailReason reason, const QString &error);
    void failRetryably(const QString &error);

    [[nodiscard]] static QString describe(const RemoteReply &reply);

    QueueEntry entry_;
    IRemoteStore *store_ = nullptr;
    QString payloadPath_;
    TransferOutcome outcome_;
};

#endif // UPLOADEXECUTOR_H
