/**
 * @file directoryremotestore.h
 * @brief Remote store backed by a local directory tree.
 */

#ifndef DIRECTORYREMOTESTORE_H
#define DIRECTORYREMOTESTORE_H

#include <QMutex>
#include <QString>

#include "services/iremotestore.h"

/**
 * @brief IRemoteStore over a directory, for the command-line tool and tests.
 *
 * Ids are paths relative to the root: a folder id names a directory
 * (empty for the root itself) and an object id names a file. Content is
 * committed atomically, so a failed transfer never leaves a partial object.
 */
class DirectoryRemoteStore : public IRemoteStore
{
public:
    /**
     * @brief Constructs a store.
     * @param rootPath Directory acting as the remote root (created on demand).
     */
    explicit DirectoryRemoteStore(const QString &rootPath);
    ~DirectoryRemoteStore() override = default;

    [[nodiscard]] QString rootPath() const { return rootPath_; }

    RemoteReply createNew(const QString &parentId,
                          const QString &name,
                          const ContentSource &source) override;
    RemoteReply overwrite(const QString &id, const ContentSource &source) override;
    RemoteReply lookupChild(const QString &parentId, const QString &name) override;

private:
    /// Maps an id to an absolute path; empty if it escapes the root
    [[nodiscard]] QString resolve(const QString &id) const;
    [[nodiscard]] static QString childId(const QString &parentId, const QString &name);
    [[nodiscard]] RemoteNode nodeFor(const QString &id) const;

    /// Streams the source into path. Caller holds mutex_.
    RemoteReply writeContent(const QString &path, const ContentSource &source);

    QString rootPath_;
    QMutex mutex_;  // Serializes the existence check with the write
};

#endif // DIRECTORYREMOTESTORE_H
