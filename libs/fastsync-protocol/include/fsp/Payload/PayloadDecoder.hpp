#pragma once

#include <fsp/Payload/Payload.hpp>
#include <QByteArray>
#include <QString>
#include <optional>

namespace fsp {

/// Turns a raw request body into a typed Payload. Every function returns
/// std::nullopt for a body the client got wrong and describes why in error.
/// Image bytes are not inspected; format sniffing happens at copy time.
class PayloadDecoder {
public:
    static std::optional<Payload> decode(ContentClass contentClass,
                                         const QByteArray& contentType,
                                         const QByteArray& body,
                                         QString* error = nullptr);

    static std::optional<Payload> decodePhoto(const QByteArray& contentType,
                                              const QByteArray& body,
                                              QString* error = nullptr);
    static std::optional<Payload> decodeSms(const QByteArray& body, QString* error = nullptr);
    static std::optional<Payload> decodeClipboard(const QByteArray& body, QString* error = nullptr);
};

} // namespace fsp
