#include "core/services/NotificationDescriptor.hpp"

namespace fastsync {

bool NotificationDescriptor::hasAction(const QString& actionId) const
{
    for (const auto& action : actions) {
        if (action.actionId == actionId)
            return true;
    }
    return false;
}

namespace NotificationText {

QString previewText(const QString& text, int maxChars)
{
    if (maxChars < 0)
        return text;

    // Walk code points so a surrogate pair is never split
    qsizetype pos = 0;
    int count = 0;
    while (pos < text.size() && count < maxChars) {
        if (text.at(pos).isHighSurrogate() && pos + 1 < text.size()
            && text.at(pos + 1).isLowSurrogate())
            pos += 2;
        else
            pos += 1;
        ++count;
    }

    if (pos >= text.size())
        return text;
    return text.left(pos) + QStringLiteral("...");
}

QString escapeMarkup(const QString& text)
{
    QString out;
    out.reserve(text.size());
    for (const QChar c : text) {
        if (c == QLatin1Char('&')) out += QStringLiteral("&amp;");
        else if (c == QLatin1Char('<')) out += QStringLiteral("&lt;");
        else if (c == QLatin1Char('>')) out += QStringLiteral("&gt;");
        else out += c;
    }
    return out;
}

QString unescapeMarkup(const QString& text)
{
    QString out = text;
    out.replace(QStringLiteral("&lt;"), QStringLiteral("<"));
    out.replace(QStringLiteral("&gt;"), QStringLiteral(">"));
    out.replace(QStringLiteral("&amp;"), QStringLiteral("&"));   // last, or "&amp;lt;" would collapse twice
    return out;
}

} // namespace NotificationText

QString DescriptorBuilder::tagFor(fsp::ContentClass contentClass)
{
    switch (contentClass) {
    case fsp::ContentClass::Photo: return tags::PHOTO;
    case fsp::ContentClass::Sms: return tags::SMS;
    case fsp::ContentClass::ClipboardText: return tags::CLIPBOARD;
    }
    return tags::PHOTO;
}

NotificationDescriptor DescriptorBuilder::build(std::shared_ptr<const fsp::Payload> payload,
                                                const QString& imagePath,
                                                const QDateTime& now) const
{
    using namespace NotificationText;

    NotificationDescriptor d;
    d.tag = tagFor(fsp::contentClassOf(*payload));
    d.originPayload = payload;

    if (std::holds_alternative<fsp::PhotoPayload>(*payload)) {
        d.title = QStringLiteral("Photo received from phone");
        d.imagePath = imagePath;
        d.ttlMs = options_.photoTtlMs;
        d.actions = {
            {QStringLiteral("Save"), actions::SAVE},
            {QStringLiteral("Copy"), actions::COPY},
            {QStringLiteral("Ignore"), actions::IGNORE},
        };
    } else if (const auto* sms = std::get_if<fsp::SmsPayload>(payload.get())) {
        d.title = QStringLiteral("SMS from %1").arg(escapeMarkup(sms->sender));
        d.bodyPreview = escapeMarkup(previewText(sms->content, options_.previewChars));
        d.ttlMs = options_.smsTtlMs;
        d.actions.append({QStringLiteral("Copy text"), actions::COPY_CONTENT});
        if (!sms->code.isEmpty())
            d.actions.append({QStringLiteral("Copy code"), actions::COPY_CODE});
        d.actions.append({QStringLiteral("Ignore"), actions::IGNORE});
    } else if (const auto* clip = std::get_if<fsp::ClipboardTextPayload>(payload.get())) {
        d.title = QStringLiteral("Clipboard received from phone");
        d.bodyPreview = escapeMarkup(previewText(clip->text, options_.previewChars));
        d.ttlMs = options_.clipboardTtlMs;
        d.actions = {
            {QStringLiteral("Copy"), actions::COPY_CLIPBOARD},
            {QStringLiteral("Ignore"), actions::IGNORE},
        };
    }

    d.expiry = now.toUTC().addMSecs(d.ttlMs);
    return d;
}

NotificationDescriptor DescriptorBuilder::buildFailureNotice(const QString& reason,
                                                             const QDateTime& now) const
{
    NotificationDescriptor d;
    d.tag = tags::ACTION_ERROR;
    d.title = QStringLiteral("FastSync action failed");
    d.bodyPreview = NotificationText::escapeMarkup(
        NotificationText::previewText(reason, options_.previewChars));
    d.ttlMs = 5000;
    d.expiry = now.toUTC().addMSecs(d.ttlMs);
    return d;
}

} // namespace fastsync
