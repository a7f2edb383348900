/**
 * @file uploaddescriptor.h
 * @brief Value types describing pending uploads.
 *
 * An UploadDescriptor is the durable description of one staged file that
 * still has to reach the remote store. It is written next to the staged
 * bytes before intake returns and removed once the upload is resolved.
 */

#ifndef UPLOADDESCRIPTOR_H
#define UPLOADDESCRIPTOR_H

#include <QJsonObject>
#include <QMetaType>
#include <QString>

#include <optional>

/**
 * @brief Durable record of one pending upload.
 */
struct UploadDescriptor {
    QString id;              ///< Unique per staged file; also names the payload
    QString path;            ///< Remote-facing logical path
    QString parentId;        ///< Remote container reference
    qint64 length = 0;       ///< Byte size of the staged payload
    bool overwrite = false;  ///< True replaces remote object `id`, false creates new
    qint64 created = 0;      ///< Intake key, strictly increasing in intake order; 0 if unknown

    /// @brief Remote name, the last component of path.
    [[nodiscard]] QString name() const;

    [[nodiscard]] QJsonObject toJson() const;

    /**
     * @brief Rebuilds a descriptor from its JSON record.
     * @return The descriptor, or std::nullopt when a required field is
     *         missing or has the wrong type.
     */
    [[nodiscard]] static std::optional<UploadDescriptor> fromJson(const QJsonObject &json);

    bool operator==(const UploadDescriptor &other) const
    {
        return id == other.id && path == other.path && parentId == other.parentId
               && length == other.length && overwrite == other.overwrite
               && created == other.created;
    }
    bool operator!=(const UploadDescriptor &other) const { return !(*this == other); }
};

/**
 * @brief Logical "currently uploading" view of a resumed item.
 *
 * Handed to the filesystem layer during recovery so the file shows up as
 * in-flight instead of missing.
 */
struct UploadingItem {
    QString path;
    QString id;
    QString parentId;
    qint64 length = 0;  ///< Size of the staged payload found on disk
};

/**
 * @brief A descriptor admitted to the work queue.
 */
struct QueueEntry {
    UploadDescriptor descriptor;
    int attempt = 1;           ///< 1 on first admission, incremented on each retry
    QString stagingDirectory;  ///< Where the payload and record live
};

Q_DECLARE_METATYPE(UploadDescriptor)

#endif // UPLOADDESCRIPTOR_H
