/**
 * @file iremotestore.h
 * @brief Interface for the remote object store that receives uploads.
 *
 * This interface allows dependency injection of store implementations,
 * enabling runtime swapping between production and mock implementations
 * for testing.
 */

#ifndef IREMOTESTORE_H
#define IREMOTESTORE_H

#include <QIODevice>
#include <QString>

#include <functional>
#include <memory>
#include <optional>

/**
 * @brief Handle of an object in the remote store.
 */
struct RemoteNode {
    QString id;        ///< Remote object id
    QString name;      ///< Object name within its parent
    QString parentId;  ///< Containing folder id
    qint64 size = 0;   ///< Size in bytes
};

/**
 * @brief Classification of a remote call result.
 */
enum class RemoteStatus {
    Ok,              ///< Call succeeded (the node may still be absent)
    Conflict,        ///< Target already exists remotely
    NotFound,        ///< Referenced object or parent does not exist
    TransportError,  ///< Connection, timeout or protocol failure
    ServerError      ///< Server rejected or failed the request
};

/// @brief Convert RemoteStatus to string for logging
[[nodiscard]] inline const char* remoteStatusToString(RemoteStatus status) {
    switch (status) {
        case RemoteStatus::Ok: return "Ok";
        case RemoteStatus::Conflict: return "Conflict";
        case RemoteStatus::NotFound: return "NotFound";
        case RemoteStatus::TransportError: return "TransportError";
        case RemoteStatus::ServerError: return "ServerError";
    }
    return "Unknown";
}

/**
 * @brief Result of a remote call.
 */
struct RemoteReply {
    RemoteStatus status = RemoteStatus::Ok;
    std::optional<RemoteNode> node;  ///< Present on success when the store returned a node
    int httpStatus = 0;              ///< Raw status code when the transport has one
    QString errorString;             ///< Human-readable error description

    [[nodiscard]] bool isOk() const { return status == RemoteStatus::Ok; }
    [[nodiscard]] bool isConflict() const { return status == RemoteStatus::Conflict; }

    [[nodiscard]] static RemoteReply success(const std::optional<RemoteNode> &node)
    {
        RemoteReply reply;
        reply.node = node;
        return reply;
    }

    [[nodiscard]] static RemoteReply failure(RemoteStatus status, const QString &error,
                                             int httpStatus = 0)
    {
        RemoteReply reply;
        reply.status = status;
        reply.errorString = error;
        reply.httpStatus = httpStatus;
        return reply;
    }
};

/**
 * @brief Opens a fresh read device over the staged bytes.
 *
 * Called once per transfer attempt; the store owns the returned device.
 * Returns nullptr if the bytes cannot be opened.
 */
using ContentSource = std::function<std::unique_ptr<QIODevice>()>;

/**
 * @brief Abstract interface for remote object store implementations.
 *
 * Calls are blocking and are made from upload worker threads, so
 * implementations must be safe to call concurrently.
 *
 * @par Example usage:
 * @code
 * // Production code
 * IRemoteStore *store = new DirectoryRemoteStore("/mnt/remote");
 *
 * // Test code
 * IRemoteStore *store = new MockRemoteStore();
 *
 * RemoteReply reply = store->createNew(parentId, "file.txt", source);
 * if (reply.isConflict()) {
 *     reply = store->lookupChild(parentId, "file.txt");
 * }
 * @endcode
 */
class IRemoteStore
{
public:
    virtual ~IRemoteStore() = default;

    /**
     * @brief Creates a new object under a parent.
     * @param parentId Remote folder id.
     * @param name Name of the new object.
     * @param source Factory for the content to upload.
     * @return Ok with the created node, Conflict if the name is taken.
     */
    virtual RemoteReply createNew(const QString &parentId,
                                  const QString &name,
                                  const ContentSource &source) = 0;

    /**
     * @brief Replaces the content of an existing object.
     * @param id Remote object id.
     * @param source Factory for the new content.
     * @return Ok with the updated node.
     */
    virtual RemoteReply overwrite(const QString &id, const ContentSource &source) = 0;

    /**
     * @brief Looks up a child object by name.
     * @param parentId Remote folder id.
     * @param name Child name.
     * @return Ok with the node, or Ok without a node if there is no such child.
     */
    virtual RemoteReply lookupChild(const QString &parentId, const QString &name) = 0;
};

#endif // IREMOTESTORE_H
