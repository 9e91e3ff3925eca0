#include <QtTest>
#include "core/services/NotificationDescriptor.hpp"

using fastsync::DescriptorBuilder;
using fastsync::NotificationText::escapeMarkup;
using fastsync::NotificationText::previewText;
using fastsync::NotificationText::unescapeMarkup;

namespace {

std::shared_ptr<const fsp::Payload> sms(const QString& content, const QString& code)
{
    return std::make_shared<const fsp::Payload>(fsp::SmsPayload{"10086", content, code});
}

QStringList actionIds(const fastsync::NotificationDescriptor& d)
{
    QStringList ids;
    for (const auto& a : d.actions)
        ids << a.actionId;
    return ids;
}

} // namespace

class TestNotificationDescriptor : public QObject {
    Q_OBJECT
private slots:
    void testPreviewShortTextUnchanged()
    {
        const QString text(100, QChar('a'));
        QCOMPARE(previewText(text), text);
    }

    void testPreviewTruncatesAtLimit()
    {
        const QString text(101, QChar('a'));
        const QString preview = previewText(text);
        QCOMPARE(preview, QString(100, QChar('a')) + "...");
    }

    void testPreviewCountsCodePoints()
    {
        // U+1F600 is two UTF-16 units but one code point
        const QString emoji = QString::fromUcs4(U"\U0001F600");
        QString text;
        for (int i = 0; i < 100; ++i)
            text += emoji;
        QCOMPARE(previewText(text), text);

        text += emoji;
        const QString preview = previewText(text);
        QVERIFY(preview.endsWith("..."));
        QCOMPARE(int(preview.toUcs4().size()) - 3, 100);
    }

    void testEscapeRemovesMarkup()
    {
        const QString raw = "a & b <tag> c";
        const QString escaped = escapeMarkup(raw);
        QCOMPARE(escaped, QString("a &amp; b &lt;tag&gt; c"));
        QVERIFY(!escaped.contains('<'));
        QVERIFY(!escaped.contains('>'));
        QCOMPARE(unescapeMarkup(escaped), raw);
    }

    void testEscapeRoundTripOfEntityLikeText()
    {
        const QString raw = "&amp; is literal";
        QCOMPARE(unescapeMarkup(escapeMarkup(raw)), raw);
    }

    void testPhotoDescriptor()
    {
        DescriptorBuilder builder;
        const QDateTime now = QDateTime::fromMSecsSinceEpoch(1000000, Qt::UTC);
        auto payload = std::make_shared<const fsp::Payload>(fsp::PhotoPayload{"bytes"});
        auto d = builder.build(payload, "/tmp/fastsync_1.jpg", now);

        QCOMPARE(d.tag, QString("CurrentPhoto"));
        QCOMPARE(d.group, QString("FastSync"));
        QCOMPARE(d.imagePath, QString("/tmp/fastsync_1.jpg"));
        QCOMPARE(actionIds(d), QStringList({"save", "copy", "ignore"}));
        QCOMPARE(d.expiry, now.addMSecs(30000));
        QCOMPARE(d.originPayload.get(), payload.get());
    }

    void testSmsOffersCopyCodeOnlyWithCode()
    {
        DescriptorBuilder builder;
        auto withCode = builder.build(sms("Your code is 1234", "1234"), {});
        QCOMPARE(actionIds(withCode), QStringList({"copy_content", "copy_code", "ignore"}));

        auto withoutCode = builder.build(sms("Hello", ""), {});
        QCOMPARE(actionIds(withoutCode), QStringList({"copy_content", "ignore"}));
        QVERIFY(!withoutCode.hasAction("copy_code"));
    }

    void testSmsDescriptorTextAndExpiry()
    {
        DescriptorBuilder builder;
        const QDateTime now = QDateTime::fromMSecsSinceEpoch(5000, Qt::UTC);
        auto d = builder.build(sms("1 < 2 & 3 > 2", ""), {}, now);

        QCOMPARE(d.tag, QString("sms_sync"));
        QCOMPARE(d.title, QString("SMS from 10086"));
        QCOMPARE(d.bodyPreview, QString("1 &lt; 2 &amp; 3 &gt; 2"));
        QCOMPARE(d.expiry, now.addMSecs(60000));
    }

    void testEscapingHappensAfterTruncation()
    {
        DescriptorBuilder builder;
        // 99 letters then "&&": truncation keeps one '&', escaping expands it
        QString content = QString(99, QChar('x')) + "&&";
        auto d = builder.build(sms(content, ""), {});
        QCOMPARE(d.bodyPreview, QString(99, QChar('x')) + "&amp;...");
    }

    void testClipboardDescriptor()
    {
        DescriptorBuilder::Options options;
        options.previewChars = 5;
        DescriptorBuilder builder(options);
        auto payload = std::make_shared<const fsp::Payload>(fsp::ClipboardTextPayload{"abcdefgh", 42});
        auto d = builder.build(payload, {});

        QCOMPARE(d.tag, QString("clipboard_sync"));
        QCOMPARE(d.bodyPreview, QString("abcde..."));
        QCOMPARE(actionIds(d), QStringList({"copy_clipboard", "ignore"}));
        QCOMPARE(d.ttlMs, 30000);
    }

    void testFailureNoticeHasNoActions()
    {
        DescriptorBuilder builder;
        auto d = builder.buildFailureNotice("disk <full>");
        QCOMPARE(d.tag, QString("action_error"));
        QVERIFY(d.actions.isEmpty());
        QVERIFY(!d.bodyPreview.contains('<'));
    }
};

QTEST_MAIN(TestNotificationDescriptor)
#include "test_notification_descriptor.moc"
