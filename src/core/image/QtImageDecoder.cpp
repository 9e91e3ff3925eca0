#include "core/image/QtImageDecoder.hpp"
#include <QImage>
#include <cstring>

namespace fastsync {

std::optional<DecodedImage> QtImageDecoder::decode(const QByteArray& bytes, QString* error) const
{
    QImage image = QImage::fromData(bytes);
    if (image.isNull()) {
        if (error) *error = QStringLiteral("unrecognized image format");
        return std::nullopt;
    }

    // RGBX keeps the byte order of RGBA with alpha forced to 0xFF
    image = image.convertToFormat(QImage::Format_RGBX8888);

    DecodedImage out;
    out.width = image.width();
    out.height = image.height();
    const qsizetype rowBytes = static_cast<qsizetype>(out.width) * 4;
    out.rgba.resize(rowBytes * out.height);
    for (int y = 0; y < out.height; ++y)
        std::memcpy(out.rgba.data() + y * rowBytes, image.constScanLine(y), static_cast<size_t>(rowBytes));

    return out;
}

} // namespace fastsync
