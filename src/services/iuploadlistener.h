/**
 * @file iuploadlistener.h
 * @brief Notification interface consumed by the filesystem layer.
 */

#ifndef IUPLOADLISTENER_H
#define IUPLOADLISTENER_H

#include "models/uploaddescriptor.h"
#include "services/iremotestore.h"

/**
 * @brief Reasons an upload is given up permanently.
 */
enum class FailReason {
    ZeroLength,         ///< Staged file is empty; nothing is sent
    NoNode,             ///< Store reported success but returned no node
    Conflict,           ///< Target exists remotely and could not be matched
    MissingPayload,     ///< Staged bytes are gone from the staging directory
    RetryLimitReached   ///< Retry policy declined another attempt
};

/// @brief Convert FailReason to string for logging
[[nodiscard]] inline const char* failReasonToString(FailReason reason) {
    switch (reason) {
        case FailReason::ZeroLength: return "ZeroLength";
        case FailReason::NoNode: return "NoNode";
        case FailReason::Conflict: return "Conflict";
        case FailReason::MissingPayload: return "MissingPayload";
        case FailReason::RetryLimitReached: return "RetryLimitReached";
    }
    return "Unknown";
}

/**
 * @brief Receives upload outcomes.
 *
 * Every accepted item ends in exactly one onUploadFinished() or
 * onUploadFailed() unless the process goes away first. Retryable failures
 * are not reported here.
 *
 * Callbacks run synchronously on the worker thread handling the item, so
 * several may run at once from different threads.
 */
class IUploadListener
{
public:
    virtual ~IUploadListener() = default;

    /**
     * @brief The item reached the remote store.
     * @param descriptor The upload that finished.
     * @param node The remote object now holding the content.
     */
    virtual void onUploadFinished(const UploadDescriptor &descriptor, const RemoteNode &node) = 0;

    /**
     * @brief The item was given up permanently.
     */
    virtual void onUploadFailed(const UploadDescriptor &descriptor, FailReason reason) = 0;

    /**
     * @brief A descriptor from a previous run is being resumed.
     *
     * Called during recovery, before the item is re-admitted.
     */
    virtual void onUploadResumed(const UploadingItem &item) = 0;
};

#endif // IUPLOADLISTENER_H
