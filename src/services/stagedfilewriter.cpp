#include "stagedfilewriter.h"

#include <QDebug>

StagedFileWriter::StagedFileWriter(const QString &path, CloseHandler onClose)
    : file_(path)
    , onClose_(std::move(onClose))
{
}

StagedFileWriter::~StagedFileWriter()
{
    if (file_.isOpen() && !closed_) {
        qWarning().noquote() << "StagedFileWriter: Discarding unclosed writer, upload not submitted:"
                             << file_.fileName();
        file_.close();
    }
}

bool StagedFileWriter::open(bool truncate)
{
    QIODevice::OpenMode mode = QIODevice::ReadWrite;
    if (truncate) {
        mode |= QIODevice::Truncate;
    }
    closed_ = false;
    return file_.open(mode);
}

qint64 StagedFileWriter::writeAt(qint64 offset, const QByteArray &data)
{
    if (!file_.isOpen() || !file_.seek(offset)) {
        return -1;
    }
    return file_.write(data);
}

qint64 StagedFileWriter::write(const QByteArray &data)
{
    return writeAt(file_.size(), data);
}

bool StagedFileWriter::setLength(qint64 length)
{
    return file_.resize(length);
}

qint64 StagedFileWriter::length() const
{
    return file_.size();
}

bool StagedFileWriter::close()
{
    if (closed_ || !file_.isOpen()) {
        return false;
    }

    if (!file_.flush()) {
        qWarning().noquote() << "StagedFileWriter: Flush failed for" << file_.fileName()
                             << "-" << file_.errorString();
        file_.close();
        closed_ = true;
        return false;
    }

    const qint64 finalLength = file_.size();
    file_.close();
    closed_ = true;

    return onClose_ ? onClose_(finalLength) : true;
}

bool StagedFileWriter::discard()
{
    if (closed_) {
        return false;
    }
    if (file_.isOpen()) {
        file_.close();
    }
    closed_ = true;
    return !file_.exists() || file_.remove();
}
