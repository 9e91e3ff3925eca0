#pragma once

#include "core/image/IImageDecoder.hpp"

namespace fastsync {

/// General purpose fallback built on QImage and the Qt image format plugins.
class QtImageDecoder : public IImageDecoder {
public:
    QString name() const override { return QStringLiteral("qt-image"); }
    std::optional<DecodedImage> decode(const QByteArray& bytes,
                                       QString* error = nullptr) const override;
};

} // namespace fastsync
