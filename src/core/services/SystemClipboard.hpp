#pragma once

#include "core/services/IClipboard.hpp"
#include <atomic>

namespace fastsync {

/// QClipboard and QFileDialog both belong to the GUI thread; calls from the
/// dispatcher worker are marshalled there and block until done.
class SystemClipboard : public IClipboard {
public:
    bool setText(const QString& text, QString* error = nullptr) override;
    bool setImage(const DecodedImage& image, QString* error = nullptr) override;
};

class SaveDialogProvider : public ISaveLocationProvider {
public:
    std::optional<QString> chooseSaveLocation(const QString& defaultFileName,
                                              QString* error = nullptr) override;
    void shutdown() override { shutdown_ = true; }

    static constexpr const char* FILTER = "Images (*.png *.jpg *.jpeg)";

private:
    std::atomic<bool> shutdown_{false};
};

} // namespace fastsync
