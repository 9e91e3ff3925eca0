#include <QtTest>
#include "ui/TrayController.hpp"

class TestTrayController : public QObject {
    Q_OBJECT
private slots:
    void testStatusWithAddress()
    {
        QCOMPARE(fastsync::TrayController::statusTextFor(QString("192.168.1.5")),
                 QString("FastSync running - IP: 192.168.1.5"));
    }

    void testStatusWithoutAddress()
    {
        QCOMPARE(fastsync::TrayController::statusTextFor(std::nullopt),
                 QString("FastSync running - IP: Unknown"));
    }

    void testStatusUsesProvider()
    {
        int calls = 0;
        fastsync::TrayController tray("FastSync Receiver", [&calls]() -> std::optional<QString> {
            ++calls;
            return QString("10.0.0.9");
        });
        QCOMPARE(tray.statusText(), QString("FastSync running - IP: 10.0.0.9"));
        QVERIFY(calls >= 1);
    }
};

QTEST_MAIN(TestTrayController)
#include "test_tray_controller.moc"
