#include "uploadexecutor.h"
#include "utils/logging.h"

#include <QFile>
#include <QFileInfo>

UploadExecutor::UploadExecutor(const QueueEntry &entry, IRemoteStore *store, const QString &payloadPath)
    : entry_(entry)
    , store_(store)
    , payloadPath_(payloadPath)
{
    Q_ASSERT(store_ && "IRemoteStore is required");
}

const TransferOutcome &UploadExecutor::run()
{
    if (outcome_.state != TransferState::Pending) {
        return outcome_;
    }

    const UploadDescriptor &item = entry_.descriptor;

    if (item.length == 0) {
        LOG_VERBOSE() << "UploadExecutor: Zero length file:" << item.path;
        failPermanently(FailReason::ZeroLength, QStringLiteral("Staged file is empty"));
        return outcome_;
    }

    if (!QFileInfo(payloadPath_).isFile()) {
        failPermanently(FailReason::MissingPayload,
                        QString("Staged file not found: %1").arg(payloadPath_));
        return outcome_;
    }

    outcome_.state = TransferState::InFlight;
    LOG_VERBOSE() << "UploadExecutor: Started upload:" << item.path
                  << "attempt" << entry_.attempt;

    transferPayload();
    return outcome_;
}

void UploadExecutor::transferPayload()
{
    const UploadDescriptor &item = entry_.descriptor;
    const QString path = payloadPath_;
    ContentSource source = [path]() -> std::unique_ptr<QIODevice> {
        auto file = std::make_unique<QFile>(path);
        if (!file->open(QIODevice::ReadOnly)) {
            return nullptr;
        }
        return file;
    };

    outcome_.remoteCalled = true;
    RemoteReply reply = item.overwrite
        ? store_->overwrite(item.id, source)
        : store_->createNew(item.parentId, item.name(), source);

    if (reply.isConflict()) {
        resolveConflict(reply);
        return;
    }

    if (!reply.isOk()) {
        failRetryably(describe(reply));
        return;
    }

    if (!reply.node) {
        outcome_.unexpected = true;
        failPermanently(FailReason::NoNode,
                        QString("File node is null: %1").arg(item.path));
        return;
    }

    succeed(*reply.node, false);
}

void UploadExecutor::resolveConflict(const RemoteReply &conflictReply)
{
    const UploadDescriptor &item = entry_.descriptor;
    qWarning().noquote() << "UploadExecutor: Upload conflict, looking up existing file:"
                         << item.path << "-" << describe(conflictReply);

    // A previous attempt may have landed with its confirmation lost
    RemoteReply lookup = store_->lookupChild(item.parentId, item.name());
    if (!lookup.isOk()) {
        failRetryably(QString("Conflict lookup failed: %1").arg(describe(lookup)));
        return;
    }

    if (lookup.node) {
        succeed(*lookup.node, true);
    } else {
        failPermanently(FailReason::Conflict,
                        QString("Upload conflict and no existing file: %1").arg(item.path));
    }
}

void UploadExecutor::succeed(const RemoteNode &node, bool viaConflict)
{
    outcome_.state = TransferState::Succeeded;
    outcome_.node = node;
    outcome_.resolvedByConflict = viaConflict;
    outcome_.error.clear();
    LOG_VERBOSE() << "UploadExecutor: Finished upload:" << entry_.descriptor.path
                  << "id:" << node.id;
}

void UploadExecutor::failPermanently(FailReason reason, const QString &error)
{
    outcome_.state = TransferState::PermanentlyFailed;
    outcome_.reason = reason;
    outcome_.error = error;
}

void UploadExecutor::failRetryably(const QString &error)
{
    outcome_.state = TransferState::RetryableFailed;
    outcome_.error = error;
}

QString UploadExecutor::describe(const RemoteReply &reply)
{
    QString text = QString::fromLatin1(remoteStatusToString(reply.status));
    if (reply.httpStatus != 0) {
        text += QString(" (HTTP %1)").arg(reply.httpStatus);
    }
    if (!reply.errorString.isEmpty()) {
        text += QString(": %1").arg(reply.errorString);
    }
    return text;
}
