/**
 * @file test_descriptorstore.cpp
 * @brief Unit tests for DescriptorStore.
 *
 * Tests verify:
 * - Records are written as JSON next to the payload
 * - Existing records are never replaced
 * - Scans return records in intake order and set aside unreadable ones
 */

#include <QtTest/QtTest>
#include <QDir>
#include <QJsonDocument>
#include <QJsonObject>
#include <QRegularExpression>
#include <QTemporaryDir>

#include "services/descriptorstore.h"

class TestDescriptorStore : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // Id validation
    void testValidIds();
    void testInvalidIds();
    void testIntakeKeysStrictlyIncrease();

    // Write and remove
    void testWriteCreatesJsonRecord();
    void testWriteRefusesExistingRecord();
    void testRemoveDeletesRecordOnly();
    void testRemoveMissingRecordSucceeds();
    void testReadRoundTripsFields();

    // Scanning
    void testScanEmptyDirectory();
    void testScanOrdersByIntakeKeyNotName();
    void testScanFallsBackToFileTimeWithoutKey();
    void testScanReportsPayloadSize();
    void testScanSetsAsideMalformedRecord();
    void testScanSetsAsideRecordWithWrongId();
    void testScanDefaultsMissingOverwriteFlag();

private:
    UploadDescriptor makeDescriptor(const QString &id, qint64 length = 5) const;
    void writePayload(const QString &id, const QByteArray &data);
    void setRecordTime(const QString &id, const QDateTime &time);
    void writeRecordWithoutKey(const QString &id);

    QTemporaryDir *tempDir_ = nullptr;
    DescriptorStore *store_ = nullptr;
};

void TestDescriptorStore::init()
{
    tempDir_ = new QTemporaryDir();
    QVERIFY(tempDir_->isValid());
    store_ = new DescriptorStore(tempDir_->path());
}

void TestDescriptorStore::cleanup()
{
    delete store_;
    store_ = nullptr;
    delete tempDir_;
    tempDir_ = nullptr;
}

UploadDescriptor TestDescriptorStore::makeDescriptor(const QString &id, qint64 length) const
{
    UploadDescriptor descriptor;
    descriptor.id = id;
    descriptor.path = "/photos/" + id + ".jpg";
    descriptor.parentId = "folder-1";
    descriptor.length = length;
    return descriptor;
}

void TestDescriptorStore::writePayload(const QString &id, const QByteArray &data)
{
    QFile payload(store_->payloadPath(id));
    QVERIFY(payload.open(QIODevice::WriteOnly));
    payload.write(data);
    payload.close();
}

void TestDescriptorStore::setRecordTime(const QString &id, const QDateTime &time)
{
    QFile record(store_->recordPath(id));
    QVERIFY(record.open(QIODevice::ReadWrite));
    QVERIFY(record.setFileTime(time, QFileDevice::FileModificationTime));
    record.close();
}

void TestDescriptorStore::writeRecordWithoutKey(const QString &id)
{
    QJsonObject json = makeDescriptor(id).toJson();
    json.remove("created");

    QFile record(store_->recordPath(id));
    QVERIFY(record.open(QIODevice::WriteOnly));
    record.write(QJsonDocument(json).toJson());
    record.close();
}

// Id validation

void TestDescriptorStore::testValidIds()
{
    QVERIFY(DescriptorStore::isValidId("abc123"));
    QVERIFY(DescriptorStore::isValidId("3f2c9a1e-7d4b-4c1e-9b8a-1234567890ab"));
    QVERIFY(DescriptorStore::isValidId("file.name"));
}

void TestDescriptorStore::testInvalidIds()
{
    QVERIFY(!DescriptorStore::isValidId(""));
    QVERIFY(!DescriptorStore::isValidId("."));
    QVERIFY(!DescriptorStore::isValidId(".."));
    QVERIFY(!DescriptorStore::isValidId("a/b"));
    QVERIFY(!DescriptorStore::isValidId("a\\b"));
    QVERIFY(!DescriptorStore::isValidId("x.info"));
}

void TestDescriptorStore::testIntakeKeysStrictlyIncrease()
{
    qint64 previous = DescriptorStore::nextIntakeKey();
    QVERIFY(previous > 0);
    for (int i = 0; i < 1000; ++i) {
        const qint64 key = DescriptorStore::nextIntakeKey();
        QVERIFY(key > previous);
        previous = key;
    }
}

// Write and remove

void TestDescriptorStore::testWriteCreatesJsonRecord()
{
    UploadDescriptor descriptor = makeDescriptor("item1", 42);
    descriptor.overwrite = true;

    QCOMPARE(store_->write(descriptor), DescriptorStore::WriteResult::Written);
    QVERIFY(store_->contains("item1"));
    QCOMPARE(store_->recordPath("item1"), QDir(tempDir_->path()).filePath("item1.info"));

    QFile record(store_->recordPath("item1"));
    QVERIFY(record.open(QIODevice::ReadOnly));
    QJsonObject json = QJsonDocument::fromJson(record.readAll()).object();
    QCOMPARE(json["id"].toString(), QString("item1"));
    QCOMPARE(json["path"].toString(), QString("/photos/item1.jpg"));
    QCOMPARE(json["parentId"].toString(), QString("folder-1"));
    QCOMPARE(json["length"].toInteger(), qint64(42));
    QCOMPARE(json["overwrite"].toBool(), true);
    QVERIFY(json["created"].toInteger() > 0);
}

void TestDescriptorStore::testWriteRefusesExistingRecord()
{
    QCOMPARE(store_->write(makeDescriptor("dup", 1)), DescriptorStore::WriteResult::Written);

    QString error;
    QCOMPARE(store_->write(makeDescriptor("dup", 99), &error),
             DescriptorStore::WriteResult::AlreadyExists);
    QVERIFY(!error.isEmpty());

    // Original record is untouched
    QCOMPARE(store_->read("dup")->length, qint64(1));
}

void TestDescriptorStore::testRemoveDeletesRecordOnly()
{
    writePayload("item2", "hello");
    QCOMPARE(store_->write(makeDescriptor("item2")), DescriptorStore::WriteResult::Written);

    QVERIFY(store_->remove("item2"));
    QVERIFY(!store_->contains("item2"));
    QVERIFY(QFile::exists(store_->payloadPath("item2")));
}

void TestDescriptorStore::testRemoveMissingRecordSucceeds()
{
    QVERIFY(store_->remove("never-written"));
}

void TestDescriptorStore::testReadRoundTripsFields()
{
    UploadDescriptor descriptor = makeDescriptor("item3", 7);
    descriptor.created = 42;
    QCOMPARE(store_->write(descriptor), DescriptorStore::WriteResult::Written);

    std::optional<UploadDescriptor> read = store_->read("item3");
    QVERIFY(read.has_value());
    QCOMPARE(*read, descriptor);
    QVERIFY(!store_->read("missing").has_value());
}

// Scanning

void TestDescriptorStore::testScanEmptyDirectory()
{
    DescriptorStore::ScanResult result = store_->scan();
    QVERIFY(result.descriptors.isEmpty());
    QVERIFY(result.corruptRecords.isEmpty());
}

void TestDescriptorStore::testScanOrdersByIntakeKeyNotName()
{
    // Written back to back, usually within one file-time tick
    const QStringList intakeOrder = {"zeta", "yankee", "xray", "whiskey", "victor"};
    for (const QString &id : intakeOrder) {
        QCOMPARE(store_->write(makeDescriptor(id)), DescriptorStore::WriteResult::Written);
    }

    DescriptorStore::ScanResult result = store_->scan();
    QStringList scanned;
    for (const StoredDescriptor &stored : result.descriptors) {
        scanned.append(stored.descriptor.id);
    }
    QCOMPARE(scanned, intakeOrder);
}

void TestDescriptorStore::testScanFallsBackToFileTimeWithoutKey()
{
    const QDateTime base = QDateTime::currentDateTime().addSecs(-3600);
    for (const QString &id : {QString("a"), QString("b"), QString("c")}) {
        writeRecordWithoutKey(id);
    }
    setRecordTime("a", base.addSecs(30));
    setRecordTime("b", base.addSecs(10));
    setRecordTime("c", base.addSecs(20));

    DescriptorStore::ScanResult result = store_->scan();
    QCOMPARE(result.descriptors.size(), 3);
    QCOMPARE(result.descriptors.at(0).descriptor.id, QString("b"));
    QCOMPARE(result.descriptors.at(1).descriptor.id, QString("c"));
    QCOMPARE(result.descriptors.at(2).descriptor.id, QString("a"));
    QCOMPARE(result.descriptors.at(0).descriptor.created, qint64(0));
}

void TestDescriptorStore::testScanReportsPayloadSize()
{
    writePayload("withdata", "0123456789");
    QCOMPARE(store_->write(makeDescriptor("withdata", 10)), DescriptorStore::WriteResult::Written);
    QCOMPARE(store_->write(makeDescriptor("nodata", 10)), DescriptorStore::WriteResult::Written);

    DescriptorStore::ScanResult result = store_->scan();
    QCOMPARE(result.descriptors.size(), 2);
    for (const StoredDescriptor &stored : result.descriptors) {
        if (stored.descriptor.id == "withdata") {
            QVERIFY(stored.payloadExists);
            QCOMPARE(stored.payloadSize, qint64(10));
        } else {
            QVERIFY(!stored.payloadExists);
            QCOMPARE(stored.payloadSize, qint64(0));
        }
    }
}

void TestDescriptorStore::testScanSetsAsideMalformedRecord()
{
    QCOMPARE(store_->write(makeDescriptor("good")), DescriptorStore::WriteResult::Written);

    QFile broken(store_->recordPath("broken"));
    QVERIFY(broken.open(QIODevice::WriteOnly));
    broken.write("{\"id\": \"broken\", \"pa");
    broken.close();

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Setting aside unreadable descriptor"));
    DescriptorStore::ScanResult result = store_->scan();

    QCOMPARE(result.descriptors.size(), 1);
    QCOMPARE(result.descriptors.first().descriptor.id, QString("good"));
    QCOMPARE(result.corruptRecords, QStringList() << "broken.info");
    QVERIFY(!QFile::exists(store_->recordPath("broken")));
    QVERIFY(QFile::exists(store_->recordPath("broken") + ".corrupt"));

    // A second scan no longer sees it
    QVERIFY(store_->scan().corruptRecords.isEmpty());
}

void TestDescriptorStore::testScanSetsAsideRecordWithWrongId()
{
    QFile record(store_->recordPath("named"));
    QVERIFY(record.open(QIODevice::WriteOnly));
    record.write(QJsonDocument(makeDescriptor("other").toJson()).toJson());
    record.close();

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Setting aside unreadable descriptor"));
    DescriptorStore::ScanResult result = store_->scan();
    QVERIFY(result.descriptors.isEmpty());
    QCOMPARE(result.corruptRecords.size(), 1);
}

void TestDescriptorStore::testScanDefaultsMissingOverwriteFlag()
{
    QJsonObject json = makeDescriptor("legacy").toJson();
    json.remove("overwrite");
    json.remove("created");

    QFile record(store_->recordPath("legacy"));
    QVERIFY(record.open(QIODevice::WriteOnly));
    record.write(QJsonDocument(json).toJson());
    record.close();

    DescriptorStore::ScanResult result = store_->scan();
    QCOMPARE(result.descriptors.size(), 1);
    QVERIFY(!result.descriptors.first().descriptor.overwrite);
}

QTEST_MAIN(TestDescriptorStore)
#include "test_descriptorstore.moc"
