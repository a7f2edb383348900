#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <QSettings>
#include <QUuid>

#include "services/directoryremotestore.h"
#include "services/iuploadlistener.h"
#include "services/uploadservice.h"
#include "services/uploadsettings.h"
#include "utils/logging.h"
#include "version.h"

namespace {

constexpr qint64 kStageChunkSize = 256 * 1024;

// Prints outcomes as they arrive from the worker threads
class ConsoleUploadListener : public IUploadListener
{
public:
    void onUploadFinished(const UploadDescriptor &descriptor, const RemoteNode &node) override
    {
        QMutexLocker locker(&mutex_);
        ++finished_;
        qInfo().noquote() << "Uploaded" << descriptor.path << "->" << node.id;
    }

    void onUploadFailed(const UploadDescriptor &descriptor, FailReason reason) override
    {
        QMutexLocker locker(&mutex_);
        ++failed_;
        qWarning().noquote() << "Upload failed:" << descriptor.path
                             << "reason:" << failReasonToString(reason);
    }

    void onUploadResumed(const UploadingItem &item) override
    {
        qInfo().noquote() << "Resuming" << item.path << QString("(%1 bytes)").arg(item.length);
    }

    int failedCount() const
    {
        QMutexLocker locker(&mutex_);
        return failed_;
    }

private:
    mutable QMutex mutex_;
    int finished_ = 0;
    int failed_ = 0;
};

bool stageFile(UploadService &service, const QString &localPath, const QString &parentId)
{
    QFile input(localPath);
    if (!input.open(QIODevice::ReadOnly)) {
        qWarning().noquote() << "Cannot read" << localPath << "-" << input.errorString();
        return false;
    }

    const QString name = QFileInfo(localPath).fileName();
    UploadDescriptor descriptor;
    descriptor.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    descriptor.path = parentId.isEmpty() ? name : parentId + '/' + name;
    descriptor.parentId = parentId;

    std::unique_ptr<StagedFileWriter> writer = service.openNew(descriptor);
    if (!writer) {
        return false;
    }

    while (!input.atEnd()) {
        const QByteArray chunk = input.read(kStageChunkSize);
        if (writer->write(chunk) != chunk.size()) {
            qWarning().noquote() << "Staging failed for" << localPath << "-" << writer->errorString();
            if (!writer->discard()) {
                qWarning().noquote() << "Could not remove partial staged file" << writer->path();
            }
            return false;
        }
    }
    return writer->close();
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("stageup");
    app.setApplicationVersion(STAGEUP_VERSION);
    app.setOrganizationName("stageup");

    // Parse command line arguments
    QCommandLineParser parser;
    parser.setApplicationDescription("Persistent upload queue for staged files");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption verboseOption(
        QStringList() << "V" << "verbose",
        "Enable verbose logging output");
    QCommandLineOption cacheOption(
        QStringList() << "c" << "cache",
        "Cache root holding staged uploads.", "dir");
    QCommandLineOption targetOption(
        QStringList() << "t" << "target",
        "Directory acting as the remote store.", "dir");
    QCommandLineOption parentOption(
        QStringList() << "p" << "parent",
        "Remote folder id to upload into (default: root).", "id");
    QCommandLineOption limitOption(
        QStringList() << "l" << "limit",
        "Maximum concurrent transfers.", "count");
    QCommandLineOption retryDelayOption(
        "retry-delay", "Delay before retrying a failed transfer.", "ms");
    QCommandLineOption maxAttemptsOption(
        "max-attempts", "Attempts per file, 0 for unlimited.", "count");
    parser.addOptions({verboseOption, cacheOption, targetOption, parentOption,
                       limitOption, retryDelayOption, maxAttemptsOption});
    parser.addPositionalArgument("files", "Files to upload.", "[files...]");

    parser.process(app);

    stageup::setVerboseLogging(parser.isSet(verboseOption));
    LOG_VERBOSE() << "Verbose logging enabled";

    QSettings settings;
    UploadSettings config = UploadSettings::load(settings);
    if (parser.isSet(cacheOption)) {
        config.cachePath = parser.value(cacheOption);
    }
    if (parser.isSet(limitOption)) {
        config.concurrency = qMax(1, parser.value(limitOption).toInt());
    }
    if (parser.isSet(retryDelayOption)) {
        config.retryDelayMs = qMax(0, parser.value(retryDelayOption).toInt());
    }
    if (parser.isSet(maxAttemptsOption)) {
        config.maxAttempts = qMax(0, parser.value(maxAttemptsOption).toInt());
    }

    if (!parser.isSet(targetOption)) {
        qCritical() << "No remote store given; use --target <dir>";
        return 2;
    }

    DirectoryRemoteStore store(parser.value(targetOption));
    ConsoleUploadListener listener;
    UploadService service(config.concurrency, &store, &listener);
    service.setRetryPolicy(std::make_shared<FixedDelayRetryPolicy>(config.retryDelayMs,
                                                                   config.maxAttempts));

    LOG_VERBOSE() << "Cache:" << config.cachePath << "limit:" << config.concurrency;
    service.recover(config.cachePath);
    if (service.stagingDirectory().isEmpty()) {
        return 2;
    }

    const QString parentId = parser.value(parentOption);
    int rejected = 0;
    for (const QString &file : parser.positionalArguments()) {
        if (!stageFile(service, file, parentId)) {
            ++rejected;
        }
    }

    service.start();
    service.waitForIdle();
    service.stop();

    return (rejected > 0 || listener.failedCount() > 0) ? 1 : 0;
}
