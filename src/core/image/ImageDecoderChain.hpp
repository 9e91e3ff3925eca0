#pragma once

#include "core/image/IImageDecoder.hpp"
#include <memory>
#include <vector>

namespace fastsync {

/// Tries each decoder in order and returns the first success.
class ImageDecoderChain {
public:
    ImageDecoderChain() = default;
    ImageDecoderChain(ImageDecoderChain&&) = default;
    ImageDecoderChain& operator=(ImageDecoderChain&&) = default;

    /// JPEG fast path first, then the general decoder.
    static ImageDecoderChain createDefault();

    void append(std::unique_ptr<IImageDecoder> decoder);
    std::size_t size() const { return decoders_.size(); }

    /// decoderName receives the name of the decoder that succeeded.
    std::optional<DecodedImage> decode(const QByteArray& bytes,
                                       QString* decoderName = nullptr,
                                       QString* error = nullptr) const;

private:
    std::vector<std::unique_ptr<IImageDecoder>> decoders_;
};

} // namespace fastsync
