#include <QtTest>
#include <QTemporaryDir>
#include "core/ReceiverConfig.hpp"

class TestReceiverConfig : public QObject {
    Q_OBJECT
private slots:
    void testDefaults();
    void testLoadFromFile();
    void testMissingFileKeepsDefaults();
    void testBrokenFileKeepsDefaults();
    void testSaveAndReload();
    void testValueByPath();
    void testValueByPathMissing();
    void testMergeKeepsUnmentionedKeys();
    void testNonPositiveBodyLimitFallsBack_data();
    void testNonPositiveBodyLimitFallsBack();
};

void TestReceiverConfig::testDefaults()
{
    fastsync::ReceiverConfig config;
    QCOMPARE(config.bindAddress(), QString("0.0.0.0"));
    QCOMPARE(config.port(), static_cast<uint16_t>(3000));
    QCOMPARE(config.maxBodyBytes(), Q_INT64_C(52428800));
    QCOMPARE(config.workerThreads(), 4);
    QCOMPARE(config.previewChars(), 100);
    QCOMPARE(config.photoTtlMs(), 30000);
    QCOMPARE(config.smsTtlMs(), 60000);
    QCOMPARE(config.clipboardTtlMs(), 30000);
    QCOMPARE(config.serviceType(), QString("_photosync._tcp.local."));
    QCOMPARE(config.instanceSuffix(), QString("_fastsync"));
    QCOMPARE(config.appId(), QString("com.duoduojuzi.fastsync"));
    QCOMPARE(config.defaultSaveFileName(), QString("image.png"));
    QVERIFY(config.discoveryEnabled());
    QVERIFY(config.reportFailures());
    QVERIFY(config.tempDir().isEmpty());
    QCOMPARE(config.logLevel(), QString("info"));
}

void TestReceiverConfig::testLoadFromFile()
{
    fastsync::ReceiverConfig config;
    QVERIFY(config.load(QString(TEST_DATA_DIR) + "/test_config.yaml"));

    QCOMPARE(config.port(), static_cast<uint16_t>(3100));
    QCOMPARE(config.workerThreads(), 2);
    QCOMPARE(config.previewChars(), 40);
    QCOMPARE(config.smsTtlMs(), 90000);
    QVERIFY(!config.discoveryEnabled());
    QCOMPARE(config.logLevel(), QString("debug"));
}

void TestReceiverConfig::testMissingFileKeepsDefaults()
{
    fastsync::ReceiverConfig config;
    QVERIFY(!config.load(QString(TEST_DATA_DIR) + "/does_not_exist.yaml"));
    QCOMPARE(config.port(), static_cast<uint16_t>(3000));
}

void TestReceiverConfig::testBrokenFileKeepsDefaults()
{
    fastsync::ReceiverConfig config;
    QVERIFY(!config.load(QString(TEST_DATA_DIR) + "/broken_config.yaml"));
    QCOMPARE(config.port(), static_cast<uint16_t>(3000));
    QCOMPARE(config.bindAddress(), QString("0.0.0.0"));
}

void TestReceiverConfig::testSaveAndReload()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.path() + "/nested/config.yaml";

    fastsync::ReceiverConfig config;
    config.setPort(0);
    QVERIFY(config.save(path));

    fastsync::ReceiverConfig reloaded;
    QVERIFY(reloaded.load(path));
    QCOMPARE(reloaded.port(), static_cast<uint16_t>(0));
    QCOMPARE(reloaded.displayName(), QString("FastSync Receiver"));
}

void TestReceiverConfig::testValueByPath()
{
    fastsync::ReceiverConfig config;
    QCOMPARE(config.valueByPath("server.port").toInt(), 3000);
    QCOMPARE(config.valueByPath("notifications.app_name").toString(), QString("FastSync"));
    QCOMPARE(config.valueByPath("discovery.enabled").toBool(), true);
}

void TestReceiverConfig::testValueByPathMissing()
{
    fastsync::ReceiverConfig config;
    QVERIFY(!config.valueByPath("server.nope").isValid());
    QVERIFY(!config.valueByPath("server").isValid());     // maps are not scalars
    QVERIFY(!config.valueByPath("").isValid());
}

void TestReceiverConfig::testMergeKeepsUnmentionedKeys()
{
    YAML::Node base = YAML::Load("a: {b: 1, c: 2}\nlist: [1, 2]");
    YAML::Node overlay = YAML::Load("a: {c: 3}\nlist: [9]");
    YAML::Node merged = fastsync::mergeYaml(base, overlay);

    QCOMPARE(merged["a"]["b"].as<int>(), 1);
    QCOMPARE(merged["a"]["c"].as<int>(), 3);
    QCOMPARE(static_cast<int>(merged["list"].size()), 1);
}

void TestReceiverConfig::testNonPositiveBodyLimitFallsBack_data()
{
    QTest::addColumn<QString>("value");
    QTest::newRow("negative") << QString("-1");
    QTest::newRow("zero") << QString("0");
}

void TestReceiverConfig::testNonPositiveBodyLimitFallsBack()
{
    QFETCH(QString, value);
    QTemporaryDir dir;
    const QString path = dir.path() + "/config.yaml";
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(QString("server:\n  max_body_bytes: %1\n").arg(value).toUtf8());
    file.close();

    fastsync::ReceiverConfig config;
    QVERIFY(config.load(path));
    QCOMPARE(config.maxBodyBytes(), Q_INT64_C(52428800));
}

QTEST_MAIN(TestReceiverConfig)
#include "test_receiver_config.moc"
