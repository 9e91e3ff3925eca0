#pragma once

#include "core/image/IImageDecoder.hpp"

namespace fastsync {

/// libavcodec MJPEG decoder followed by a swscale conversion to RGBA.
/// Only accepts input that starts with a JPEG SOI marker.
class JpegImageDecoder : public IImageDecoder {
public:
    QString name() const override { return QStringLiteral("ffmpeg-mjpeg"); }
    std::optional<DecodedImage> decode(const QByteArray& bytes,
                                       QString* error = nullptr) const override;

    static bool looksLikeJpeg(const QByteArray& bytes);
};

} // namespace fastsync
