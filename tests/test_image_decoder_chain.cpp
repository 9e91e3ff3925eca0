#include <QtTest>
#include <QBuffer>
#include <QImage>
#include "core/image/ImageDecoderChain.hpp"
#include "core/image/JpegImageDecoder.hpp"
#include "core/image/QtImageDecoder.hpp"

namespace {

QByteArray encode(const QImage& image, const char* format, int quality = -1)
{
    QByteArray bytes;
    QBuffer buffer(&bytes);
    buffer.open(QIODevice::WriteOnly);
    if (!image.save(&buffer, format, quality))
        return {};
    return bytes;
}

QImage gradient(int w, int h)
{
    QImage image(w, h, QImage::Format_RGB32);
    for (int y = 0; y < h; ++y)
        for (int x = 0; x < w; ++x)
            image.setPixelColor(x, y, QColor(x * 255 / w, y * 255 / h, 128));
    return image;
}

class FailingDecoder : public fastsync::IImageDecoder {
public:
    QString name() const override { return "always-fails"; }
    std::optional<fastsync::DecodedImage> decode(const QByteArray&, QString* error) const override
    {
        if (error) *error = "nope";
        return std::nullopt;
    }
};

} // namespace

class TestImageDecoderChain : public QObject {
    Q_OBJECT
private slots:
    void testPngFallsBackToQtDecoder()
    {
        const QByteArray png = encode(gradient(16, 8), "PNG");
        auto chain = fastsync::ImageDecoderChain::createDefault();
        QCOMPARE(chain.size(), std::size_t(2));

        QString decoder;
        auto image = chain.decode(png, &decoder);
        QVERIFY(image.has_value());
        QCOMPARE(decoder, QString("qt-image"));
        QCOMPARE(image->width, 16);
        QCOMPARE(image->height, 8);
        QCOMPARE(image->rgba.size(), qsizetype(16 * 8 * 4));
    }

    void testJpegUsesFastPath()
    {
        const QByteArray jpeg = encode(gradient(32, 16), "JPG", 95);
        if (jpeg.isEmpty())
            QSKIP("Qt JPEG image plugin not available");

        auto chain = fastsync::ImageDecoderChain::createDefault();
        QString decoder;
        auto image = chain.decode(jpeg, &decoder);
        QVERIFY(image.has_value());
        QCOMPARE(decoder, QString("ffmpeg-mjpeg"));
        QCOMPARE(image->width, 32);
        QCOMPARE(image->height, 16);
        QCOMPARE(image->rgba.size(), qsizetype(32 * 16 * 4));

        // Opaque alpha everywhere
        for (qsizetype i = 3; i < image->rgba.size(); i += 4)
            QCOMPARE(uchar(image->rgba.at(i)), uchar(255));
    }

    void testJpegDecodersAgreeOnDimensions()
    {
        const QByteArray jpeg = encode(gradient(20, 12), "JPG", 90);
        if (jpeg.isEmpty())
            QSKIP("Qt JPEG image plugin not available");

        auto fast = fastsync::JpegImageDecoder().decode(jpeg);
        auto general = fastsync::QtImageDecoder().decode(jpeg);
        QVERIFY(fast && general);
        QCOMPARE(fast->width, general->width);
        QCOMPARE(fast->height, general->height);
    }

    void testJpegDecoderRejectsNonJpeg()
    {
        QString error;
        QVERIFY(!fastsync::JpegImageDecoder().decode(encode(gradient(4, 4), "PNG"), &error));
        QVERIFY(!error.isEmpty());
        QVERIFY(fastsync::JpegImageDecoder::looksLikeJpeg(QByteArray("\xFF\xD8\xFF\xE0", 4)));
    }

    void testTruncatedJpegFallsThrough()
    {
        QByteArray bogus("\xFF\xD8\xFF\xE0", 4);
        bogus.append(QByteArray(64, '\0'));
        auto chain = fastsync::ImageDecoderChain::createDefault();
        QString error;
        QVERIFY(!chain.decode(bogus, nullptr, &error).has_value());
        QVERIFY(error.contains("ffmpeg-mjpeg"));
        QVERIFY(error.contains("qt-image"));
    }

    void testCustomOrder()
    {
        fastsync::ImageDecoderChain chain;
        chain.append(std::make_unique<FailingDecoder>());
        chain.append(std::make_unique<fastsync::QtImageDecoder>());

        QString decoder;
        QVERIFY(chain.decode(encode(gradient(2, 2), "PNG"), &decoder).has_value());
        QCOMPARE(decoder, QString("qt-image"));
    }

    void testEmptyChainFails()
    {
        fastsync::ImageDecoderChain chain;
        QString error;
        QVERIFY(!chain.decode("x", nullptr, &error));
        QVERIFY(!error.isEmpty());
    }
};

QTEST_MAIN(TestImageDecoderChain)
#include "test_image_decoder_chain.moc"
