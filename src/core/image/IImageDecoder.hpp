#pragma once

#include <QByteArray>
#include <QString>
#include <optional>

namespace fastsync {

/// Interleaved RGBA, 8 bits per channel, rows packed with no padding.
struct DecodedImage {
    int width = 0;
    int height = 0;
    QByteArray rgba;    // width * height * 4 bytes
};

class IImageDecoder {
public:
    virtual ~IImageDecoder() = default;

    virtual QString name() const = 0;
    virtual std::optional<DecodedImage> decode(const QByteArray& bytes,
                                               QString* error = nullptr) const = 0;
};

} // namespace fastsync
