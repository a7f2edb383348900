/**
 * @file descriptorstore.h
 * @brief Durable storage of upload descriptors in the staging directory.
 *
 * Each pending upload owns two files in the staging directory:
 * - `<id>`      the staged payload bytes
 * - `<id>.info` the JSON descriptor written by this store
 *
 * A descriptor exists exactly as long as its upload is outstanding.
 */

#ifndef DESCRIPTORSTORE_H
#define DESCRIPTORSTORE_H

#include <QDateTime>
#include <QList>
#include <QString>
#include <QStringList>

#include "models/uploaddescriptor.h"

/**
 * @brief A descriptor read back from disk during a scan.
 */
struct StoredDescriptor {
    UploadDescriptor descriptor;
    QString recordPath;           ///< Absolute path of the .info record
    QDateTime created;            ///< When the record was written
    qint64 intakeKey = 0;         ///< Recovery sort key, see DescriptorStore::scan()
    bool payloadExists = false;   ///< Whether the staged bytes are present
    qint64 payloadSize = 0;       ///< Size of the staged bytes on disk
};

/**
 * @brief Reads and writes descriptor records under one staging directory.
 *
 * Not internally locked: every operation touches only the files of one id,
 * and ids are unique per staged file. scan() runs once at recovery time.
 */
class DescriptorStore
{
public:
    /// Suffix distinguishing a descriptor record from its payload
    static constexpr const char *RecordSuffix = ".info";

    /// Suffix given to records that could not be parsed
    static constexpr const char *CorruptSuffix = ".corrupt";

    enum class WriteResult {
        Written,        ///< Record persisted
        AlreadyExists,  ///< A record for this id is already on disk
        Failed          ///< I/O error; see the error string
    };

    /**
     * @brief Result of scanning the staging directory.
     */
    struct ScanResult {
        QList<StoredDescriptor> descriptors;  ///< Ordered by creation time, oldest first
        QStringList corruptRecords;           ///< Records that were set aside
    };

    DescriptorStore() = default;
    explicit DescriptorStore(const QString &directory);

    void setDirectory(const QString &directory) { directory_ = directory; }
    [[nodiscard]] QString directory() const { return directory_; }
    [[nodiscard]] bool hasDirectory() const { return !directory_.isEmpty(); }

    /**
     * @brief Checks that an id can name files in the staging directory.
     *
     * Rejects empty ids, "." and "..", path separators, and ids ending in
     * the record suffix.
     */
    [[nodiscard]] static bool isValidId(const QString &id);

    /**
     * @brief Returns the next intake key for UploadDescriptor::created.
     *
     * Keys are microsecond-scaled wall-clock times bumped to stay strictly
     * increasing within the process, so records written in the same
     * millisecond still sort in intake order.
     */
    [[nodiscard]] static qint64 nextIntakeKey();

    [[nodiscard]] QString payloadPath(const QString &id) const;
    [[nodiscard]] QString recordPath(const QString &id) const;

    /**
     * @brief Returns true if a record for id exists.
     */
    [[nodiscard]] bool contains(const QString &id) const;

    /**
     * @brief Persists a descriptor, refusing to replace an existing one.
     * @param descriptor The descriptor to write.
     * @param error Receives the error description on failure (may be null).
     *
     * The record is committed atomically, so a crash leaves either no record
     * or a complete one. A descriptor without an intake key is stamped with
     * nextIntakeKey(). The existence check and the commit are not one step;
     * callers writing the same id concurrently must serialize.
     */
    [[nodiscard]] WriteResult write(const UploadDescriptor &descriptor, QString *error = nullptr);

    /**
     * @brief Deletes the record for id.
     * @return True if the record is gone afterwards.
     */
    bool remove(const QString &id, QString *error = nullptr);

    /**
     * @brief Reads one record back.
     * @return The descriptor or std::nullopt if missing or malformed.
     */
    [[nodiscard]] std::optional<UploadDescriptor> read(const QString &id) const;

    /**
     * @brief Lists every record in the staging directory.
     *
     * Records are ordered oldest first by their intake key. Records without
     * one are keyed by their modification time on the same scale. The file
     * name breaks ties. Records that cannot be parsed are
     * renamed with CorruptSuffix so later scans skip them.
     */
    [[nodiscard]] ScanResult scan() const;

private:
    [[nodiscard]] static std::optional<UploadDescriptor> parseRecord(const QString &recordPath,
                                                                     QString *error);

    QString directory_;
};

#endif // DESCRIPTORSTORE_H
