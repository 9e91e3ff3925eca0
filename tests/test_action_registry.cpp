#include <QTest>
#include "core/services/ActionRegistry.hpp"

class TestActionRegistry : public QObject {
    Q_OBJECT
private slots:
    void testRegisterAndDispatch()
    {
        fastsync::ActionRegistry registry;
        bool called = false;
        registry.registerAction("copy_clipboard", [&](const fsp::Payload&) {
            called = true;
            return fastsync::ActionResult::copied("text");
        });

        auto result = registry.dispatch("copy_clipboard", fsp::ClipboardTextPayload{"t", 0});
        QVERIFY(called);
        QCOMPARE(result.kind, fastsync::ActionResult::Kind::Copied);
        QCOMPARE(result.detail, QString("text"));
    }

    void testUnknownActionIsIgnored()
    {
        fastsync::ActionRegistry registry;
        auto result = registry.dispatch("nonexistent", fsp::PhotoPayload{});
        QCOMPARE(result.kind, fastsync::ActionResult::Kind::Ignored);
    }

    void testHandlerSeesPayload()
    {
        fastsync::ActionRegistry registry;
        QString received;
        registry.registerAction("copy_code", [&](const fsp::Payload& p) {
            received = std::get<fsp::SmsPayload>(p).code;
            return fastsync::ActionResult::copied("text");
        });

        registry.dispatch("copy_code", fsp::SmsPayload{"s", "c", "9876"});
        QCOMPARE(received, QString("9876"));
    }

    void testUnregister()
    {
        fastsync::ActionRegistry registry;
        int count = 0;
        registry.registerAction("ignore", [&](const fsp::Payload&) {
            ++count;
            return fastsync::ActionResult::ignored();
        });

        registry.dispatch("ignore", fsp::PhotoPayload{});
        QCOMPARE(count, 1);

        registry.unregisterAction("ignore");
        QVERIFY(!registry.contains("ignore"));
        registry.dispatch("ignore", fsp::PhotoPayload{});
        QCOMPARE(count, 1);
    }

    void testListActions()
    {
        fastsync::ActionRegistry registry;
        registry.registerAction("a", [](const fsp::Payload&) { return fastsync::ActionResult::ignored(); });
        registry.registerAction("b", [](const fsp::Payload&) { return fastsync::ActionResult::ignored(); });

        auto actions = registry.registeredActions();
        QCOMPARE(actions.size(), 2);
        QVERIFY(actions.contains("a"));
        QVERIFY(actions.contains("b"));
    }

    void testResultToString()
    {
        QCOMPARE(fastsync::ActionResult::saved("/tmp/a.png").toString(), QString("Saved(/tmp/a.png)"));
        QCOMPARE(fastsync::ActionResult::failed("boom").toString(), QString("Failed(boom)"));
        QVERIFY(fastsync::ActionResult::failed("boom").isFailure());
    }
};

QTEST_MAIN(TestActionRegistry)
#include "test_action_registry.moc"
