#include "descriptorstore.h"

#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QMutex>
#include <QMutexLocker>
#include <QSaveFile>

#include <algorithm>

DescriptorStore::DescriptorStore(const QString &directory)
    : directory_(directory)
{
}

bool DescriptorStore::isValidId(const QString &id)
{
    if (id.isEmpty() || id == "." || id == "..") {
        return false;
    }
    if (id.contains('/') || id.contains('\\') || id.contains(QChar('\0'))) {
        return false;
    }
    return !id.endsWith(QLatin1String(RecordSuffix)) && !id.endsWith(QLatin1String(CorruptSuffix));
}

qint64 DescriptorStore::nextIntakeKey()
{
    static QMutex mutex;
    static qint64 lastKey = 0;

    QMutexLocker locker(&mutex);
    lastKey = std::max(lastKey + 1, QDateTime::currentMSecsSinceEpoch() * 1000);
    return lastKey;
}

QString DescriptorStore::payloadPath(const QString &id) const
{
    return QDir(directory_).filePath(id);
}

QString DescriptorStore::recordPath(const QString &id) const
{
    return payloadPath(id) + QLatin1String(RecordSuffix);
}

bool DescriptorStore::contains(const QString &id) const
{
    return QFile::exists(recordPath(id));
}

DescriptorStore::WriteResult DescriptorStore::write(const UploadDescriptor &descriptor, QString *error)
{
    const QString path = recordPath(descriptor.id);
    if (QFile::exists(path)) {
        if (error) {
            *error = QString("Descriptor already exists: %1").arg(path);
        }
        return WriteResult::AlreadyExists;
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        if (error) {
            *error = file.errorString();
        }
        return WriteResult::Failed;
    }

    UploadDescriptor record = descriptor;
    if (record.created <= 0) {
        record.created = nextIntakeKey();
    }

    const QByteArray data = QJsonDocument(record.toJson()).toJson(QJsonDocument::Compact);
    if (file.write(data) != data.size()) {
        if (error) {
            *error = file.errorString();
        }
        file.cancelWriting();
        return WriteResult::Failed;
    }

    if (!file.commit()) {
        if (error) {
            *error = file.errorString();
        }
        return WriteResult::Failed;
    }
    return WriteResult::Written;
}

bool DescriptorStore::remove(const QString &id, QString *error)
{
    QFile file(recordPath(id));
    if (!file.exists()) {
        return true;
    }
    if (!file.remove()) {
        if (error) {
            *error = file.errorString();
        }
        return false;
    }
    return true;
}

std::optional<UploadDescriptor> DescriptorStore::read(const QString &id) const
{
    QString error;
    return parseRecord(recordPath(id), &error);
}

DescriptorStore::ScanResult DescriptorStore::scan() const
{
    ScanResult result;

    QDir dir(directory_);
    if (!dir.exists()) {
        return result;
    }

    const QFileInfoList records = dir.entryInfoList(
        QStringList() << QString("*%1").arg(QLatin1String(RecordSuffix)),
        QDir::Files | QDir::NoDotAndDotDot);

    for (const QFileInfo &info : records) {
        QString error;
        std::optional<UploadDescriptor> descriptor = parseRecord(info.absoluteFilePath(), &error);

        // The record name ties the descriptor to its payload
        const QString expectedId = info.fileName().chopped(int(qstrlen(RecordSuffix)));
        if (descriptor && descriptor->id != expectedId) {
            error = QString("id \"%1\" does not match record name").arg(descriptor->id);
            descriptor.reset();
        }

        if (!descriptor) {
            qWarning().noquote() << "DescriptorStore: Setting aside unreadable descriptor"
                                 << info.fileName() << "-" << error;
            const QString asidePath = info.absoluteFilePath() + QLatin1String(CorruptSuffix);
            QFile::remove(asidePath);
            if (!QFile::rename(info.absoluteFilePath(), asidePath)) {
                qWarning().noquote() << "DescriptorStore: Could not rename" << info.fileName();
            }
            result.corruptRecords.append(info.fileName());
            continue;
        }

        StoredDescriptor stored;
        stored.descriptor = *descriptor;
        stored.recordPath = info.absoluteFilePath();
        // Records are written once, so the modification time is their creation time
        stored.created = info.lastModified();
        stored.intakeKey = descriptor->created > 0
            ? descriptor->created
            : stored.created.toMSecsSinceEpoch() * 1000;

        QFileInfo payload(payloadPath(descriptor->id));
        stored.payloadExists = payload.exists() && payload.isFile();
        stored.payloadSize = stored.payloadExists ? payload.size() : 0;

        result.descriptors.append(stored);
    }

    std::stable_sort(result.descriptors.begin(), result.descriptors.end(),
                     [](const StoredDescriptor &a, const StoredDescriptor &b) {
                         if (a.intakeKey != b.intakeKey) {
                             return a.intakeKey < b.intakeKey;
                         }
                         return a.recordPath < b.recordPath;
                     });

    return result;
}

std::optional<UploadDescriptor> DescriptorStore::parseRecord(const QString &recordPath, QString *error)
{
    QFile file(recordPath);
    if (!file.open(QIODevice::ReadOnly)) {
        *error = file.errorString();
        return std::nullopt;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        *error = parseError.errorString();
        return std::nullopt;
    }
    if (!doc.isObject()) {
        *error = QStringLiteral("record is not a JSON object");
        return std::nullopt;
    }

    std::optional<UploadDescriptor> descriptor = UploadDescriptor::fromJson(doc.object());
    if (!descriptor) {
        *error = QStringLiteral("record is missing required fields");
    }
    return descriptor;
}
