#include <QtTest>
#include "core/services/NotificationRegistry.hpp"
#include <thread>
#include <vector>

namespace {

fastsync::LiveNotification entry(const QString& tag, quint32 id)
{
    fastsync::LiveNotification e;
    e.tag = tag;
    e.notificationId = id;
    e.payload = std::make_shared<const fsp::Payload>(fsp::ClipboardTextPayload{"x", 0});
    return e;
}

} // namespace

class TestNotificationRegistry : public QObject {
    Q_OBJECT
private slots:
    void testInsertReplacesPerTag()
    {
        fastsync::NotificationRegistry registry;
        QVERIFY(!registry.insert(entry("sms_sync", 1)).has_value());

        auto previous = registry.insert(entry("sms_sync", 2));
        QVERIFY(previous.has_value());
        QCOMPARE(previous->notificationId, 1u);
        QCOMPARE(registry.size(), 1);
        QCOMPARE(registry.find("sms_sync")->notificationId, 2u);
    }

    void testTagsAreIndependent()
    {
        fastsync::NotificationRegistry registry;
        registry.insert(entry("sms_sync", 1));
        registry.insert(entry("CurrentPhoto", 2));
        QCOMPARE(registry.size(), 2);
        QVERIFY(registry.contains("CurrentPhoto"));
        QVERIFY(!registry.contains("clipboard_sync"));
    }

    void testFindByNotificationId()
    {
        fastsync::NotificationRegistry registry;
        registry.insert(entry("sms_sync", 7));
        QCOMPARE(registry.findByNotificationId(7)->tag, QString("sms_sync"));
        QVERIFY(!registry.findByNotificationId(8).has_value());
        QVERIFY(!registry.findByNotificationId(0).has_value());
    }

    void testClaimActivationAtMostOnce()
    {
        fastsync::NotificationRegistry registry;
        registry.insert(entry("clipboard_sync", 3));

        auto first = registry.claimActivation(3);
        QVERIFY(first.has_value());
        QVERIFY(first->payload != nullptr);
        QVERIFY(!registry.claimActivation(3).has_value());
    }

    void testClaimActivationOfSupersededId()
    {
        fastsync::NotificationRegistry registry;
        registry.insert(entry("clipboard_sync", 3));
        registry.insert(entry("clipboard_sync", 4));
        QVERIFY(!registry.claimActivation(3).has_value());
        QVERIFY(registry.claimActivation(4).has_value());
    }

    void testConcurrentInserts()
    {
        fastsync::NotificationRegistry registry;
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&registry, t]() {
                for (int i = 0; i < 500; ++i)
                    registry.insert(entry(t % 2 ? "sms_sync" : "CurrentPhoto", quint32(t * 1000 + i + 1)));
            });
        }
        for (auto& th : threads)
            th.join();
        QCOMPARE(registry.size(), 2);
    }
};

QTEST_MAIN(TestNotificationRegistry)
#include "test_notification_registry.moc"
