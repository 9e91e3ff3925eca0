#include "core/services/SystemClipboard.hpp"
#include <QClipboard>
#include <QDir>
#include <QFileDialog>
#include <QGuiApplication>
#include <QImage>
#include <QStandardPaths>
#include <QThread>

namespace fastsync {

namespace {

// Run fn on the GUI thread and wait for it. false when there is no GUI.
template <typename Fn>
bool runOnGuiThread(Fn fn)
{
    auto* app = QGuiApplication::instance();
    if (!app || !qobject_cast<QGuiApplication*>(app))
        return false;
    if (QThread::currentThread() == app->thread()) {
        fn();
        return true;
    }
    return QMetaObject::invokeMethod(app, fn, Qt::BlockingQueuedConnection);
}

} // namespace

bool SystemClipboard::setText(const QString& text, QString* error)
{
    const bool ok = runOnGuiThread([text]() {
        QGuiApplication::clipboard()->setText(text);
    });
    if (!ok && error)
        *error = QStringLiteral("no GUI clipboard available");
    return ok;
}

bool SystemClipboard::setImage(const DecodedImage& image, QString* error)
{
    if (image.width <= 0 || image.height <= 0
        || image.rgba.size() != static_cast<qsizetype>(image.width) * image.height * 4) {
        if (error) *error = QStringLiteral("image buffer does not match its dimensions");
        return false;
    }

    // copy() detaches from the QByteArray before it goes out of scope
    QImage qimage = QImage(reinterpret_cast<const uchar*>(image.rgba.constData()),
                           image.width, image.height, image.width * 4,
                           QImage::Format_RGBA8888).copy();

    const bool ok = runOnGuiThread([qimage]() {
        QGuiApplication::clipboard()->setImage(qimage);
    });
    if (!ok && error)
        *error = QStringLiteral("no GUI clipboard available");
    return ok;
}

std::optional<QString> SaveDialogProvider::chooseSaveLocation(const QString& defaultFileName,
                                                              QString* error)
{
    if (shutdown_)
        return std::nullopt;

    QString dir = QStandardPaths::writableLocation(QStandardPaths::PicturesLocation);
    if (dir.isEmpty())
        dir = QDir::homePath();
    const QString suggested = QDir(dir).filePath(defaultFileName);

    QString chosen;
    const bool ok = runOnGuiThread([this, &chosen, suggested]() {
        // Queued before shutdown, delivered while the dispatcher drains
        if (shutdown_)
            return;
        chosen = QFileDialog::getSaveFileName(nullptr, QObject::tr("Save image"),
                                              suggested, QString::fromLatin1(FILTER));
    });
    if (!ok) {
        if (error) *error = QStringLiteral("no GUI available for the save dialog");
        return std::nullopt;
    }
    if (chosen.isEmpty())
        return std::nullopt;
    return chosen;
}

} // namespace fastsync
