#include <QtTest>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include "core/DesktopEntry.hpp"

class TestDesktopEntry : public QObject {
    Q_OBJECT
private slots:
    void testInstallWritesEntry()
    {
        QTemporaryDir dir;
        const QString path = fastsync::installDesktopEntry(
            "com.duoduojuzi.fastsync", "FastSync Receiver", "/opt/fast sync/fastsync-receiver", dir.path());

        QCOMPARE(QFileInfo(path).fileName(), QString("com.duoduojuzi.fastsync.desktop"));
        QFile file(path);
        QVERIFY(file.open(QIODevice::ReadOnly));
        const QString content = QString::fromUtf8(file.readAll());
        QVERIFY(content.startsWith("[Desktop Entry]\n"));
        QVERIFY(content.contains("Name=FastSync Receiver\n"));
        QVERIFY(content.contains("Exec=\"/opt/fast sync/fastsync-receiver\"\n"));
    }

    void testInstallIsIdempotent()
    {
        QTemporaryDir dir;
        const QString first = fastsync::installDesktopEntry("app.id", "App", "/usr/bin/app", dir.path());
        const QDateTime written = QFileInfo(first).lastModified();

        QTest::qWait(20);
        const QString second = fastsync::installDesktopEntry("app.id", "App", "/usr/bin/app", dir.path());
        QCOMPARE(second, first);
        QCOMPARE(QFileInfo(second).lastModified(), written);
    }

    void testInstallUpdatesChangedExecutable()
    {
        QTemporaryDir dir;
        const QString path = fastsync::installDesktopEntry("app.id", "App", "/usr/bin/app", dir.path());
        fastsync::installDesktopEntry("app.id", "App", "/usr/local/bin/app", dir.path());

        QFile file(path);
        QVERIFY(file.open(QIODevice::ReadOnly));
        QVERIFY(file.readAll().contains("Exec=/usr/local/bin/app\n"));
    }
};

QTEST_MAIN(TestDesktopEntry)
#include "test_desktop_entry.moc"
