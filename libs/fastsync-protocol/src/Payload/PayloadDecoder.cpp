#include <fsp/Payload/PayloadDecoder.hpp>
#include <fsp/Payload/MultipartParser.hpp>
#include <fsp/Protocol.hpp>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <cmath>

namespace fsp {

namespace {

void setError(QString* error, const QString& message)
{
    if (error) *error = message;
}

std::optional<QJsonObject> parseObject(const QByteArray& body, QString* error)
{
    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(body, &err);
    if (err.error != QJsonParseError::NoError) {
        setError(error, QStringLiteral("invalid JSON: %1").arg(err.errorString()));
        return std::nullopt;
    }
    if (!doc.isObject()) {
        setError(error, QStringLiteral("JSON body is not an object"));
        return std::nullopt;
    }
    return doc.object();
}

bool readString(const QJsonObject& obj, const char* key, QString& out, QString* error)
{
    const QJsonValue v = obj.value(QLatin1String(key));
    if (!v.isString()) {
        setError(error, v.isUndefined()
                 ? QStringLiteral("missing field '%1'").arg(QLatin1String(key))
                 : QStringLiteral("field '%1' must be a string").arg(QLatin1String(key)));
        return false;
    }
    out = v.toString();
    return true;
}

bool readInteger(const QJsonObject& obj, const char* key, qint64& out, QString* error)
{
    const QJsonValue v = obj.value(QLatin1String(key));
    if (!v.isDouble()) {
        setError(error, v.isUndefined()
                 ? QStringLiteral("missing field '%1'").arg(QLatin1String(key))
                 : QStringLiteral("field '%1' must be a number").arg(QLatin1String(key)));
        return false;
    }
    const double d = v.toDouble();
    if (std::trunc(d) != d) {
        setError(error, QStringLiteral("field '%1' must be an integer").arg(QLatin1String(key)));
        return false;
    }
    out = v.toInteger();
    return true;
}

} // namespace

std::optional<Payload> PayloadDecoder::decode(ContentClass contentClass,
                                              const QByteArray& contentType,
                                              const QByteArray& body,
                                              QString* error)
{
    switch (contentClass) {
    case ContentClass::Photo: return decodePhoto(contentType, body, error);
    case ContentClass::Sms: return decodeSms(body, error);
    case ContentClass::ClipboardText: return decodeClipboard(body, error);
    }
    setError(error, QStringLiteral("unsupported content class"));
    return std::nullopt;
}

std::optional<Payload> PayloadDecoder::decodePhoto(const QByteArray& contentType,
                                                   const QByteArray& body,
                                                   QString* error)
{
    const QByteArray boundary = MultipartParser::boundaryFromContentType(contentType);
    if (boundary.isEmpty()) {
        setError(error, QStringLiteral("expected multipart/form-data with a boundary"));
        return std::nullopt;
    }

    auto parts = MultipartParser::parse(body, boundary, error);
    if (!parts)
        return std::nullopt;

    // Last "data" field wins, everything else is ignored
    std::optional<QByteArray> image;
    for (const FormPart& part : *parts) {
        if (part.name == QLatin1String(PHOTO_FIELD))
            image = part.data;
    }

    if (!image) {
        setError(error, QStringLiteral("missing '%1' field").arg(QLatin1String(PHOTO_FIELD)));
        return std::nullopt;
    }
    return Payload{PhotoPayload{*image}};
}

std::optional<Payload> PayloadDecoder::decodeSms(const QByteArray& body, QString* error)
{
    auto obj = parseObject(body, error);
    if (!obj) return std::nullopt;

    SmsPayload sms;
    if (!readString(*obj, "sender", sms.sender, error)) return std::nullopt;
    if (!readString(*obj, "content", sms.content, error)) return std::nullopt;
    if (!readString(*obj, "code", sms.code, error)) return std::nullopt;
    return Payload{sms};
}

std::optional<Payload> PayloadDecoder::decodeClipboard(const QByteArray& body, QString* error)
{
    auto obj = parseObject(body, error);
    if (!obj) return std::nullopt;

    ClipboardTextPayload clip;
    if (!readString(*obj, "text", clip.text, error)) return std::nullopt;
    if (!readInteger(*obj, "timestamp", clip.timestamp, error)) return std::nullopt;
    return Payload{clip};
}

} // namespace fsp
