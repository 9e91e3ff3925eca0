#include "core/image/JpegImageDecoder.hpp"
#include <cstring>
#include <memory>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/frame.h>
#include <libavutil/imgutils.h>
#include <libswscale/swscale.h>
}

namespace fastsync {

namespace {

void setError(QString* error, const QString& message)
{
    if (error) *error = message;
}

struct CodecContextDeleter {
    void operator()(AVCodecContext* ctx) const { avcodec_free_context(&ctx); }
};
struct PacketDeleter {
    void operator()(AVPacket* pkt) const { av_packet_free(&pkt); }
};
struct FrameDeleter {
    void operator()(AVFrame* frame) const { av_frame_free(&frame); }
};
struct SwsDeleter {
    void operator()(SwsContext* ctx) const { sws_freeContext(ctx); }
};

// The MJPEG decoder reports JPEG-range formats; swscale wants the plain ones
AVPixelFormat normalizedFormat(int format)
{
    switch (format) {
    case AV_PIX_FMT_YUVJ420P: return AV_PIX_FMT_YUV420P;
    case AV_PIX_FMT_YUVJ422P: return AV_PIX_FMT_YUV422P;
    case AV_PIX_FMT_YUVJ444P: return AV_PIX_FMT_YUV444P;
    case AV_PIX_FMT_YUVJ440P: return AV_PIX_FMT_YUV440P;
    default: return static_cast<AVPixelFormat>(format);
    }
}

bool isFullRange(int format)
{
    return format == AV_PIX_FMT_YUVJ420P || format == AV_PIX_FMT_YUVJ422P
        || format == AV_PIX_FMT_YUVJ444P || format == AV_PIX_FMT_YUVJ440P;
}

} // namespace

bool JpegImageDecoder::looksLikeJpeg(const QByteArray& bytes)
{
    return bytes.size() >= 3
        && static_cast<unsigned char>(bytes.at(0)) == 0xFF
        && static_cast<unsigned char>(bytes.at(1)) == 0xD8
        && static_cast<unsigned char>(bytes.at(2)) == 0xFF;
}

std::optional<DecodedImage> JpegImageDecoder::decode(const QByteArray& bytes, QString* error) const
{
    if (!looksLikeJpeg(bytes)) {
        setError(error, QStringLiteral("not a JPEG stream"));
        return std::nullopt;
    }

    const AVCodec* codec = avcodec_find_decoder(AV_CODEC_ID_MJPEG);
    if (!codec) {
        setError(error, QStringLiteral("no MJPEG decoder in libavcodec"));
        return std::nullopt;
    }

    std::unique_ptr<AVCodecContext, CodecContextDeleter> ctx(avcodec_alloc_context3(codec));
    std::unique_ptr<AVPacket, PacketDeleter> packet(av_packet_alloc());
    std::unique_ptr<AVFrame, FrameDeleter> frame(av_frame_alloc());
    if (!ctx || !packet || !frame) {
        setError(error, QStringLiteral("allocation failed"));
        return std::nullopt;
    }

    ctx->thread_count = 1;
    if (avcodec_open2(ctx.get(), codec, nullptr) < 0) {
        setError(error, QStringLiteral("avcodec_open2 failed"));
        return std::nullopt;
    }

    // libavcodec may read past the end of the input, so hand it a padded copy
    if (av_new_packet(packet.get(), static_cast<int>(bytes.size())) < 0) {
        setError(error, QStringLiteral("av_new_packet failed"));
        return std::nullopt;
    }
    std::memcpy(packet->data, bytes.constData(), static_cast<size_t>(bytes.size()));

    int ret = avcodec_send_packet(ctx.get(), packet.get());
    if (ret >= 0)
        avcodec_send_packet(ctx.get(), nullptr);    // flush
    if (ret >= 0)
        ret = avcodec_receive_frame(ctx.get(), frame.get());
    if (ret < 0) {
        char buf[AV_ERROR_MAX_STRING_SIZE] = {};
        av_strerror(ret, buf, sizeof(buf));
        setError(error, QStringLiteral("MJPEG decode failed: %1").arg(QString::fromUtf8(buf)));
        return std::nullopt;
    }

    const int width = frame->width;
    const int height = frame->height;
    if (width <= 0 || height <= 0) {
        setError(error, QStringLiteral("decoded frame has no size"));
        return std::nullopt;
    }

    std::unique_ptr<SwsContext, SwsDeleter> sws(sws_getContext(
        width, height, normalizedFormat(frame->format),
        width, height, AV_PIX_FMT_RGBA,
        SWS_BILINEAR, nullptr, nullptr, nullptr));
    if (!sws) {
        setError(error, QStringLiteral("no swscale path from pixel format %1").arg(frame->format));
        return std::nullopt;
    }

    if (isFullRange(frame->format)) {
        const int* coeffs = sws_getCoefficients(SWS_CS_DEFAULT);
        sws_setColorspaceDetails(sws.get(), coeffs, 1, coeffs, 1, 0, 1 << 16, 1 << 16);
    }

    DecodedImage image;
    image.width = width;
    image.height = height;
    image.rgba.resize(static_cast<qsizetype>(width) * height * 4);

    uint8_t* dstData[4] = { reinterpret_cast<uint8_t*>(image.rgba.data()), nullptr, nullptr, nullptr };
    int dstLinesize[4] = { width * 4, 0, 0, 0 };
    const int rows = sws_scale(sws.get(), frame->data, frame->linesize, 0, height,
                               dstData, dstLinesize);
    if (rows != height) {
        setError(error, QStringLiteral("sws_scale produced %1 of %2 rows").arg(rows).arg(height));
        return std::nullopt;
    }

    // JPEG has no alpha; make sure the channel is opaque whatever swscale wrote
    char* px = image.rgba.data();
    for (qsizetype i = 3; i < image.rgba.size(); i += 4)
        px[i] = static_cast<char>(0xFF);

    return image;
}

} // namespace fastsync
