/**
 * @file test_uploadexecutor.cpp
 * @brief Unit tests for the per-item transfer state machine.
 */

#include <QtTest>
#include <QFile>
#include <QRegularExpression>
#include <QTemporaryDir>

#include "services/uploadexecutor.h"
#include "mocks/mockremotestore.h"

class TestUploadExecutor : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir *tempDir_ = nullptr;
    MockRemoteStore *store_ = nullptr;

    QueueEntry makeEntry(const QString &id, qint64 length, bool overwrite = false)
    {
        UploadDescriptor descriptor;
        descriptor.id = id;
        descriptor.path = "/notes/" + id + ".txt";
        descriptor.parentId = "folder-7";
        descriptor.length = length;
        descriptor.overwrite = overwrite;
        return QueueEntry{descriptor, 1};
    }

    QString stage(const QString &id, const QByteArray &data)
    {
        QString path = tempDir_->filePath(id);
        QFile file(path);
        if (file.open(QIODevice::WriteOnly)) {
            file.write(data);
            file.close();
        }
        return path;
    }

private slots:
    void init()
    {
        tempDir_ = new QTemporaryDir();
        QVERIFY(tempDir_->isValid());
        store_ = new MockRemoteStore();
    }

    void cleanup()
    {
        delete store_;
        store_ = nullptr;
        delete tempDir_;
        tempDir_ = nullptr;
    }

    // ========== Before any remote call ==========

    void testStartsPending()
    {
        UploadExecutor executor(makeEntry("a", 3), store_, stage("a", "abc"));
        QCOMPARE(executor.state(), TransferState::Pending);
        QVERIFY(!executor.outcome().isTerminal());
    }

    void testZeroLengthFailsWithoutRemoteCall()
    {
        UploadExecutor executor(makeEntry("empty", 0), store_, stage("empty", ""));
        const TransferOutcome &outcome = executor.run();

        QCOMPARE(outcome.state, TransferState::PermanentlyFailed);
        QCOMPARE(outcome.reason, FailReason::ZeroLength);
        QVERIFY(!outcome.remoteCalled);
        QCOMPARE(store_->mockCreateCount(), 0);
        QCOMPARE(store_->mockOverwriteCount(), 0);
    }

    void testMissingPayloadFailsWithoutRemoteCall()
    {
        UploadExecutor executor(makeEntry("gone", 12), store_, tempDir_->filePath("gone"));
        const TransferOutcome &outcome = executor.run();

        QCOMPARE(outcome.state, TransferState::PermanentlyFailed);
        QCOMPARE(outcome.reason, FailReason::MissingPayload);
        QVERIFY(!outcome.remoteCalled);
        QCOMPARE(store_->mockCreateCount(), 0);
    }

    // ========== Success ==========

    void testCreateNewSucceeds()
    {
        UploadExecutor executor(makeEntry("new", 5), store_, stage("new", "hello"));
        const TransferOutcome &outcome = executor.run();

        QCOMPARE(outcome.state, TransferState::Succeeded);
        QVERIFY(outcome.isTerminal());
        QVERIFY(outcome.node.has_value());
        QCOMPARE(outcome.node->name, QString("new.txt"));
        QCOMPARE(outcome.node->parentId, QString("folder-7"));
        QVERIFY(!outcome.resolvedByConflict);
        QCOMPARE(store_->mockCreateCount(), 1);
        QCOMPARE(store_->mockReceivedContent("new.txt"), QByteArray("hello"));
    }

    void testOverwriteUsesDescriptorId()
    {
        UploadExecutor executor(makeEntry("remote-42", 4, true), store_, stage("remote-42", "data"));
        const TransferOutcome &outcome = executor.run();

        QCOMPARE(outcome.state, TransferState::Succeeded);
        QCOMPARE(store_->mockOverwriteCount(), 1);
        QCOMPARE(store_->mockCreateCount(), 0);
        QCOMPARE(store_->mockStartedTransfers(), QStringList() << "remote-42");
        QCOMPARE(store_->mockReceivedContent("remote-42"), QByteArray("data"));
    }

    void testRunTwiceKeepsFirstOutcome()
    {
        UploadExecutor executor(makeEntry("once", 1), store_, stage("once", "x"));
        executor.run();
        executor.run();
        QCOMPARE(store_->mockCreateCount(), 1);
        QCOMPARE(executor.state(), TransferState::Succeeded);
    }

    // ========== Failures ==========

    void testSuccessWithoutNodeIsUnexpected()
    {
        store_->mockQueueCreateReply(RemoteReply::success(std::nullopt));

        UploadExecutor executor(makeEntry("nonode", 2), store_, stage("nonode", "ab"));
        const TransferOutcome &outcome = executor.run();

        QCOMPARE(outcome.state, TransferState::PermanentlyFailed);
        QCOMPARE(outcome.reason, FailReason::NoNode);
        QVERIFY(outcome.unexpected);
    }

    void testTransportErrorIsRetryable_data()
    {
        QTest::addColumn<int>("status");
        QTest::newRow("transport") << int(RemoteStatus::TransportError);
        QTest::newRow("server") << int(RemoteStatus::ServerError);
        QTest::newRow("notfound") << int(RemoteStatus::NotFound);
    }

    void testTransportErrorIsRetryable()
    {
        QFETCH(int, status);
        store_->mockQueueCreateReply(
            RemoteReply::failure(static_cast<RemoteStatus>(status), "boom", 503));

        UploadExecutor executor(makeEntry("flaky", 2), store_, stage("flaky", "ab"));
        const TransferOutcome &outcome = executor.run();

        QCOMPARE(outcome.state, TransferState::RetryableFailed);
        QVERIFY(!outcome.isTerminal());
        QVERIFY(outcome.error.contains("boom"));
        QVERIFY(outcome.error.contains("503"));
        QCOMPARE(store_->mockLookupCount(), 0);
    }

    // ========== Conflicts ==========

    void testConflictResolvedByLookup()
    {
        RemoteNode existing;
        existing.id = "node-existing";
        existing.name = "dup.txt";
        store_->mockQueueCreateReply(RemoteReply::failure(RemoteStatus::Conflict, "exists", 409));
        store_->mockQueueLookupReply(RemoteReply::success(existing));

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Upload conflict"));
        UploadExecutor executor(makeEntry("dup", 3), store_, stage("dup", "abc"));
        const TransferOutcome &outcome = executor.run();

        QCOMPARE(outcome.state, TransferState::Succeeded);
        QVERIFY(outcome.resolvedByConflict);
        QCOMPARE(outcome.node->id, QString("node-existing"));
        QCOMPARE(store_->mockLookupCount(), 1);
    }

    void testConflictWithoutExistingNodeFails()
    {
        store_->mockQueueCreateReply(RemoteReply::failure(RemoteStatus::Conflict, "exists", 409));

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Upload conflict"));
        UploadExecutor executor(makeEntry("clash", 3), store_, stage("clash", "abc"));
        const TransferOutcome &outcome = executor.run();

        QCOMPARE(outcome.state, TransferState::PermanentlyFailed);
        QCOMPARE(outcome.reason, FailReason::Conflict);
        QVERIFY(!outcome.unexpected);
    }

    void testConflictLookupErrorIsRetryable()
    {
        store_->mockQueueCreateReply(RemoteReply::failure(RemoteStatus::Conflict, "exists", 409));
        store_->mockQueueLookupReply(RemoteReply::failure(RemoteStatus::TransportError, "reset"));

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Upload conflict"));
        UploadExecutor executor(makeEntry("lost", 3), store_, stage("lost", "abc"));
        const TransferOutcome &outcome = executor.run();

        QCOMPARE(outcome.state, TransferState::RetryableFailed);
        QVERIFY(outcome.error.contains("reset"));
    }
};

QTEST_MAIN(TestUploadExecutor)
#include "test_uploadexecutor.moc"
