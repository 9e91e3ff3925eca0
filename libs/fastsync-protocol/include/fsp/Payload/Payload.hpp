#pragma once

#include <QByteArray>
#include <QString>
#include <variant>

namespace fsp {

enum class ContentClass {
    Photo,
    Sms,
    ClipboardText
};

struct PhotoPayload {
    QByteArray bytes;   // raw image as sent, never transcoded
};

struct SmsPayload {
    QString sender;
    QString content;
    QString code;       // verification code, empty when none was detected
};

struct ClipboardTextPayload {
    QString text;
    qint64 timestamp = 0;   // epoch millis on the phone
};

using Payload = std::variant<PhotoPayload, SmsPayload, ClipboardTextPayload>;

inline ContentClass contentClassOf(const Payload& payload)
{
    if (std::holds_alternative<PhotoPayload>(payload)) return ContentClass::Photo;
    if (std::holds_alternative<SmsPayload>(payload)) return ContentClass::Sms;
    return ContentClass::ClipboardText;
}

inline const char* contentClassName(ContentClass c)
{
    switch (c) {
    case ContentClass::Photo: return "photo";
    case ContentClass::Sms: return "sms";
    case ContentClass::ClipboardText: return "clipboard";
    }
    return "unknown";
}

} // namespace fsp
