/**
 * @file stagedfilewriter.h
 * @brief Write handle over a staged payload that submits on close.
 */

#ifndef STAGEDFILEWRITER_H
#define STAGEDFILEWRITER_H

#include <QByteArray>
#include <QFile>
#include <QString>

#include <functional>

/**
 * @brief Writes the bytes of a file being staged for upload.
 *
 * The filesystem layer writes blocks at arbitrary offsets while the user
 * writes the file. close() finalizes the bytes and hands the final length
 * to the close handler, which submits the upload. The handler runs at most
 * once.
 *
 * A writer destroyed without close() keeps the bytes it wrote but submits
 * nothing.
 *
 * @par Example usage:
 * @code
 * std::unique_ptr<StagedFileWriter> writer = service->openNew(descriptor);
 * writer->writeAt(0, block);
 * writer->close();  // descriptor written, upload queued
 * @endcode
 */
class StagedFileWriter
{
public:
    /// Receives the final byte length; returns whether the submit succeeded
    using CloseHandler = std::function<bool(qint64 finalLength)>;

    /**
     * @brief Constructs a writer.
     * @param path Path of the staged payload.
     * @param onClose Called once from close().
     */
    StagedFileWriter(const QString &path, CloseHandler onClose);
    ~StagedFileWriter();

    StagedFileWriter(const StagedFileWriter &) = delete;
    StagedFileWriter &operator=(const StagedFileWriter &) = delete;

    /**
     * @brief Opens the payload for writing, creating it if needed.
     * @param truncate True discards existing content.
     * @return False on I/O error; see errorString().
     */
    bool open(bool truncate);

    [[nodiscard]] bool isOpen() const { return file_.isOpen(); }

    /**
     * @brief Writes a block at an offset.
     * @return Number of bytes written, -1 on error.
     */
    qint64 writeAt(qint64 offset, const QByteArray &data);

    /**
     * @brief Appends data at the current end of the file.
     */
    qint64 write(const QByteArray &data);

    /**
     * @brief Resizes the payload.
     */
    bool setLength(qint64 length);

    [[nodiscard]] qint64 length() const;

    /**
     * @brief Finalizes the payload and submits the upload.
     * @return The close handler's result, false if the bytes could not be
     *         flushed (the handler is then not called).
     */
    bool close();

    /**
     * @brief Abandons the staged file without submitting it.
     * @return True if the payload is gone from disk.
     *
     * For writers that failed mid-way; nothing is queued and no bytes are
     * left behind in the staging directory.
     */
    bool discard();

    [[nodiscard]] QString path() const { return file_.fileName(); }
    [[nodiscard]] QString errorString() const { return file_.errorString(); }

private:
    QFile file_;
    CloseHandler onClose_;
    bool closed_ = false;
};

#endif // STAGEDFILEWRITER_H
