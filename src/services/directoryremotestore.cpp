#include "directoryremotestore.h"

#include <QDir>
#include <QFileInfo>
#include <QMutexLocker>
#include <QSaveFile>

namespace {
constexpr qint64 kCopyChunkSize = 64 * 1024;
} // namespace

DirectoryRemoteStore::DirectoryRemoteStore(const QString &rootPath)
    : rootPath_(QDir::cleanPath(QDir(rootPath).absolutePath()))
{
}

RemoteReply DirectoryRemoteStore::createNew(const QString &parentId,
                                            const QString &name,
                                            const ContentSource &source)
{
    if (name.isEmpty() || name.contains('/') || name == "." || name == "..") {
        return RemoteReply::failure(RemoteStatus::ServerError,
                                    QString("Invalid name \"%1\"").arg(name), 400);
    }

    if (parentId.isEmpty()) {
        if (!QDir().mkpath(rootPath_)) {
            return RemoteReply::failure(RemoteStatus::ServerError,
                                        QString("Cannot create root %1").arg(rootPath_), 500);
        }
    } else {
        const QString parentPath = resolve(parentId);
        if (parentPath.isEmpty() || !QFileInfo(parentPath).isDir()) {
            return RemoteReply::failure(RemoteStatus::NotFound,
                                        QString("Parent not found: %1").arg(parentId), 404);
        }
    }

    const QString id = childId(parentId, name);
    const QString path = resolve(id);

    QMutexLocker locker(&mutex_);
    if (QFileInfo::exists(path)) {
        return RemoteReply::failure(RemoteStatus::Conflict,
                                    QString("Object already exists: %1").arg(id), 409);
    }

    RemoteReply reply = writeContent(path, source);
    if (reply.isOk()) {
        reply.node = nodeFor(id);
    }
    return reply;
}

RemoteReply DirectoryRemoteStore::overwrite(const QString &id, const ContentSource &source)
{
    const QString path = resolve(id);
    if (path.isEmpty() || !QFileInfo(path).isFile()) {
        return RemoteReply::failure(RemoteStatus::NotFound,
                                    QString("Object not found: %1").arg(id), 404);
    }

    QMutexLocker locker(&mutex_);
    RemoteReply reply = writeContent(path, source);
    if (reply.isOk()) {
        reply.node = nodeFor(id);
    }
    return reply;
}

RemoteReply DirectoryRemoteStore::lookupChild(const QString &parentId, const QString &name)
{
    const QString parentPath = resolve(parentId);
    if (parentPath.isEmpty() || !QFileInfo(parentPath).isDir()) {
        return RemoteReply::failure(RemoteStatus::NotFound,
                                    QString("Parent not found: %1").arg(parentId), 404);
    }

    const QString id = childId(parentId, name);
    if (!QFileInfo::exists(resolve(id))) {
        return RemoteReply::success(std::nullopt);
    }
    return RemoteReply::success(nodeFor(id));
}

QString DirectoryRemoteStore::resolve(const QString &id) const
{
    if (id.isEmpty()) {
        return rootPath_;
    }
    const QString path = QDir::cleanPath(QDir(rootPath_).filePath(id));
    if (path != rootPath_ && !path.startsWith(rootPath_ + '/')) {
        return QString();
    }
    return path;
}

QString DirectoryRemoteStore::childId(const QString &parentId, const QString &name)
{
    return parentId.isEmpty() ? name : parentId + '/' + name;
}

RemoteNode DirectoryRemoteStore::nodeFor(const QString &id) const
{
    QFileInfo info(resolve(id));

    RemoteNode node;
    node.id = id;
    node.name = info.fileName();
    int slash = id.lastIndexOf('/');
    node.parentId = slash < 0 ? QString() : id.left(slash);
    node.size = info.size();
    return node;
}

RemoteReply DirectoryRemoteStore::writeContent(const QString &path, const ContentSource &source)
{
    std::unique_ptr<QIODevice> input = source ? source() : nullptr;
    if (!input) {
        return RemoteReply::failure(RemoteStatus::TransportError,
                                    QStringLiteral("Could not open content source"));
    }

    QSaveFile output(path);
    if (!output.open(QIODevice::WriteOnly)) {
        return RemoteReply::failure(RemoteStatus::ServerError, output.errorString(), 500);
    }

    while (!input->atEnd()) {
        const QByteArray chunk = input->read(kCopyChunkSize);
        if (chunk.isEmpty() && !input->atEnd()) {
            output.cancelWriting();
            return RemoteReply::failure(RemoteStatus::TransportError, input->errorString());
        }
        if (output.write(chunk) != chunk.size()) {
            output.cancelWriting();
            return RemoteReply::failure(RemoteStatus::ServerError, output.errorString(), 500);
        }
    }

    if (!output.commit()) {
        return RemoteReply::failure(RemoteStatus::ServerError, output.errorString(), 500);
    }
    return RemoteReply::success(std::nullopt);
}
