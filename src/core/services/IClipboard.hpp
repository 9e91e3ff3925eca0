#pragma once

#include "core/image/IImageDecoder.hpp"
#include <QString>
#include <optional>

namespace fastsync {

class IClipboard {
public:
    virtual ~IClipboard() = default;
    virtual bool setText(const QString& text, QString* error = nullptr) = 0;
    virtual bool setImage(const DecodedImage& image, QString* error = nullptr) = 0;
};

class ISaveLocationProvider {
public:
    virtual ~ISaveLocationProvider() = default;

    /// Ask the user where to save. std::nullopt with an empty error means
    /// cancelled; a set error means no prompt could be shown.
    virtual std::optional<QString> chooseSaveLocation(const QString& defaultFileName,
                                                      QString* error = nullptr) = 0;

    /// Refuse further prompts. Pending and later calls resolve as cancelled.
    virtual void shutdown() {}
};

} // namespace fastsync
