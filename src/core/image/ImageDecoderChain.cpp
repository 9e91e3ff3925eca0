#include "core/image/ImageDecoderChain.hpp"
#include "core/image/JpegImageDecoder.hpp"
#include "core/image/QtImageDecoder.hpp"
#include <QStringList>
#include <boost/log/trivial.hpp>

namespace fastsync {

ImageDecoderChain ImageDecoderChain::createDefault()
{
    ImageDecoderChain chain;
    chain.append(std::make_unique<JpegImageDecoder>());
    chain.append(std::make_unique<QtImageDecoder>());
    return chain;
}

void ImageDecoderChain::append(std::unique_ptr<IImageDecoder> decoder)
{
    if (decoder)
        decoders_.push_back(std::move(decoder));
}

std::optional<DecodedImage> ImageDecoderChain::decode(const QByteArray& bytes,
                                                      QString* decoderName,
                                                      QString* error) const
{
    QStringList failures;
    for (const auto& decoder : decoders_) {
        QString reason;
        auto image = decoder->decode(bytes, &reason);
        if (image) {
            if (decoderName) *decoderName = decoder->name();
            BOOST_LOG_TRIVIAL(debug) << "[ImageDecoder] " << decoder->name().toStdString()
                                     << " decoded " << image->width << "x" << image->height;
            return image;
        }
        BOOST_LOG_TRIVIAL(debug) << "[ImageDecoder] " << decoder->name().toStdString()
                                 << " failed: " << reason.toStdString();
        failures << decoder->name() + ": " + reason;
    }

    if (error)
        *error = failures.isEmpty() ? QStringLiteral("no image decoders configured")
                                    : failures.join("; ");
    return std::nullopt;
}

} // namespace fastsync
