#include <fsp/Payload/MultipartParser.hpp>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(lcMultipart, "fsp.payload.multipart")

namespace fsp {

namespace {

void setError(QString* error, const QString& message)
{
    if (error) *error = message;
}

QByteArray unquote(QByteArray value)
{
    value = value.trimmed();
    if (value.size() >= 2 && value.startsWith('"') && value.endsWith('"')) {
        value = value.mid(1, value.size() - 2);
        value.replace("\\\"", "\"");
        value.replace("\\\\", "\\");
    }
    return value;
}

// Split "form-data; name=\"a;b\"; filename=x" on ';' outside quotes.
QList<QByteArray> splitParams(const QByteArray& header)
{
    QList<QByteArray> out;
    QByteArray current;
    bool quoted = false;
    for (qsizetype i = 0; i < header.size(); ++i) {
        const char c = header.at(i);
        if (c == '"' && (i == 0 || header.at(i - 1) != '\\'))
            quoted = !quoted;
        if (c == ';' && !quoted) {
            out.append(current.trimmed());
            current.clear();
            continue;
        }
        current.append(c);
    }
    if (!current.trimmed().isEmpty())
        out.append(current.trimmed());
    return out;
}

void applyHeader(FormPart& part, const QByteArray& line)
{
    const qsizetype colon = line.indexOf(':');
    if (colon <= 0) return;

    const QByteArray name = line.left(colon).trimmed().toLower();
    const QByteArray value = line.mid(colon + 1).trimmed();

    if (name == "content-type") {
        part.contentType = value;
        return;
    }
    if (name != "content-disposition") return;

    for (const QByteArray& param : splitParams(value)) {
        const qsizetype eq = param.indexOf('=');
        if (eq < 0) continue;
        const QByteArray key = param.left(eq).trimmed().toLower();
        const QByteArray val = unquote(param.mid(eq + 1));
        if (key == "name")
            part.name = QString::fromUtf8(val);
        else if (key == "filename")
            part.fileName = QString::fromUtf8(val);
    }
}

} // namespace

QByteArray MultipartParser::boundaryFromContentType(const QByteArray& contentType)
{
    const QList<QByteArray> params = splitParams(contentType);
    if (params.isEmpty() || params.first().toLower() != "multipart/form-data")
        return {};

    for (qsizetype i = 1; i < params.size(); ++i) {
        const qsizetype eq = params[i].indexOf('=');
        if (eq < 0) continue;
        if (params[i].left(eq).trimmed().toLower() == "boundary")
            return unquote(params[i].mid(eq + 1));
    }
    return {};
}

std::optional<QList<FormPart>> MultipartParser::parse(const QByteArray& body,
                                                      const QByteArray& boundary,
                                                      QString* error)
{
    if (boundary.isEmpty()) {
        setError(error, QStringLiteral("missing multipart boundary"));
        return std::nullopt;
    }

    const QByteArray delimiter = "--" + boundary;
    const QByteArray partEnd = "\r\n" + delimiter;

    qsizetype pos = body.indexOf(delimiter);
    if (pos < 0) {
        setError(error, QStringLiteral("opening boundary not found"));
        return std::nullopt;
    }
    pos += delimiter.size();

    QList<FormPart> parts;
    while (true) {
        if (body.mid(pos, 2) == "--")
            return parts;

        // Transport padding is allowed between the boundary and its CRLF
        while (pos < body.size() && (body.at(pos) == ' ' || body.at(pos) == '\t'))
            ++pos;
        if (body.mid(pos, 2) != "\r\n") {
            setError(error, QStringLiteral("malformed boundary line at offset %1").arg(pos));
            return std::nullopt;
        }
        pos += 2;

        qsizetype dataStart;
        QByteArray headerBlock;
        if (body.mid(pos, 2) == "\r\n") {
            dataStart = pos + 2;   // part without headers
        } else {
            const qsizetype headerEnd = body.indexOf("\r\n\r\n", pos);
            if (headerEnd < 0) {
                setError(error, QStringLiteral("unterminated part headers"));
                return std::nullopt;
            }
            headerBlock = body.mid(pos, headerEnd - pos);
            dataStart = headerEnd + 4;
        }

        const qsizetype next = body.indexOf(partEnd, dataStart);
        if (next < 0) {
            setError(error, QStringLiteral("unterminated part body"));
            return std::nullopt;
        }

        FormPart part;
        for (const QByteArray& line : headerBlock.split('\n'))
            applyHeader(part, line.trimmed());
        part.data = body.mid(dataStart, next - dataStart);

        qCDebug(lcMultipart) << "part" << part.name << part.data.size() << "bytes";
        parts.append(part);

        pos = next + partEnd.size();
    }
}

} // namespace fsp
