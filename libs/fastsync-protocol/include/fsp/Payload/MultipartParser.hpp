#pragma once

#include <QByteArray>
#include <QList>
#include <QString>
#include <optional>

namespace fsp {

struct FormPart {
    QString name;
    QString fileName;
    QByteArray contentType;
    QByteArray data;
};

/// Minimal multipart/form-data reader (RFC 7578). Works on a fully
/// buffered body; the gateway enforces the size cap before we get here.
class MultipartParser {
public:
    /// Extract the boundary parameter of a multipart/form-data Content-Type.
    /// Returns an empty array for any other media type or a missing boundary.
    static QByteArray boundaryFromContentType(const QByteArray& contentType);

    /// Split body into parts. Returns std::nullopt on a malformed body and
    /// fills error when given.
    static std::optional<QList<FormPart>> parse(const QByteArray& body,
                                                const QByteArray& boundary,
                                                QString* error = nullptr);
};

} // namespace fsp
