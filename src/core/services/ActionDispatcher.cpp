#include "core/services/ActionDispatcher.hpp"
#include "core/services/NotificationDescriptor.hpp"
#include <QCoreApplication>
#include <QSaveFile>
#include <boost/log/trivial.hpp>

namespace fastsync {

ActionDispatcher::ActionDispatcher(IClipboard* clipboard,
                                   ISaveLocationProvider* saveLocation,
                                   ImageDecoderChain decoders,
                                   const QString& defaultSaveFileName,
                                   QObject* parent)
    : QObject(parent)
    , clipboard_(clipboard)
    , saveLocation_(saveLocation)
    , decoders_(std::move(decoders))
    , defaultSaveFileName_(defaultSaveFileName)
{
    qRegisterMetaType<fastsync::ActionRequest>();
    qRegisterMetaType<fastsync::ActionResult>();
    registerDefaultActions();
}

ActionDispatcher::~ActionDispatcher()
{
    stop();
}

void ActionDispatcher::registerDefaultActions()
{
    registry_.registerAction(actions::SAVE, [this](const fsp::Payload& p) { return savePhoto(p); });
    registry_.registerAction(actions::COPY, [this](const fsp::Payload& p) { return copyPhoto(p); });

    registry_.registerAction(actions::COPY_CONTENT, [this](const fsp::Payload& p) {
        const auto* sms = std::get_if<fsp::SmsPayload>(&p);
        return sms ? copyText(sms->content) : ActionResult::failed("copy_content needs an SMS");
    });
    registry_.registerAction(actions::COPY_CODE, [this](const fsp::Payload& p) {
        const auto* sms = std::get_if<fsp::SmsPayload>(&p);
        if (!sms)
            return ActionResult::failed("copy_code needs an SMS");
        if (sms->code.isEmpty())
            return ActionResult::ignored();
        return copyText(sms->code);
    });
    registry_.registerAction(actions::COPY_CLIPBOARD, [this](const fsp::Payload& p) {
        const auto* clip = std::get_if<fsp::ClipboardTextPayload>(&p);
        return clip ? copyText(clip->text) : ActionResult::failed("copy_clipboard needs clipboard text");
    });

    registry_.registerAction(actions::IGNORE, [](const fsp::Payload&) { return ActionResult::ignored(); });
}

void ActionDispatcher::start()
{
    if (worker_) return;
    worker_ = new DispatchWorker(this);
    worker_->start();
    BOOST_LOG_TRIVIAL(info) << "[ActionDispatcher] Worker thread started";
}

void ActionDispatcher::stop()
{
    if (!worker_) return;
    worker_->requestStop();
    if (saveLocation_)
        saveLocation_->shutdown();

    // The worker may be blocked on a call queued to the GUI thread; keep
    // delivering those while waiting when this is the GUI thread.
    auto* app = QCoreApplication::instance();
    if (app && QThread::currentThread() == app->thread()) {
        while (!worker_->wait(50))
            QCoreApplication::processEvents(QEventLoop::ExcludeUserInputEvents);
    } else {
        worker_->wait();
    }
    delete worker_;
    worker_ = nullptr;
    BOOST_LOG_TRIVIAL(info) << "[ActionDispatcher] Worker thread stopped";
}

void ActionDispatcher::submit(const ActionRequest& request)
{
    if (!worker_) {
        BOOST_LOG_TRIVIAL(warning) << "[ActionDispatcher] Not started, dropping '"
                                   << request.actionId.toStdString() << "'";
        return;
    }
    worker_->enqueue(request);
}

ActionResult ActionDispatcher::dispatch(const ActionRequest& request)
{
    ActionResult result;
    if (!request.payload) {
        result = ActionResult::failed(QStringLiteral("request has no payload"));
    } else {
        try {
            result = registry_.dispatch(request.actionId, *request.payload);
        } catch (const std::exception& e) {
            result = ActionResult::failed(QString::fromUtf8(e.what()));
        }
    }

    if (result.isFailure())
        BOOST_LOG_TRIVIAL(error) << "[ActionDispatcher] " << request.tag.toStdString() << "/"
                                 << request.actionId.toStdString() << " -> "
                                 << result.toString().toStdString();
    else
        BOOST_LOG_TRIVIAL(info) << "[ActionDispatcher] " << request.tag.toStdString() << "/"
                                << request.actionId.toStdString() << " -> "
                                << result.toString().toStdString();

    emit actionFinished(request, result);
    return result;
}

ActionResult ActionDispatcher::savePhoto(const fsp::Payload& payload)
{
    const auto* photo = std::get_if<fsp::PhotoPayload>(&payload);
    if (!photo)
        return ActionResult::failed(QStringLiteral("save needs a photo"));
    if (!saveLocation_)
        return ActionResult::failed(QStringLiteral("no save dialog available"));

    QString error;
    auto path = saveLocation_->chooseSaveLocation(defaultSaveFileName_, &error);
    if (!path)
        return error.isEmpty() ? ActionResult::ignored() : ActionResult::failed(error);

    QSaveFile file(*path);
    if (!file.open(QIODevice::WriteOnly))
        return ActionResult::failed(QStringLiteral("%1: %2").arg(*path, file.errorString()));
    if (file.write(photo->bytes) != photo->bytes.size() || !file.commit())
        return ActionResult::failed(QStringLiteral("%1: %2").arg(*path, file.errorString()));

    return ActionResult::saved(*path);
}

ActionResult ActionDispatcher::copyPhoto(const fsp::Payload& payload)
{
    const auto* photo = std::get_if<fsp::PhotoPayload>(&payload);
    if (!photo)
        return ActionResult::failed(QStringLiteral("copy needs a photo"));

    QString decoderName;
    QString error;
    auto image = decoders_.decode(photo->bytes, &decoderName, &error);
    if (!image)
        return ActionResult::failed(QStringLiteral("image decode failed (%1)").arg(error));

    if (!clipboard_ || !clipboard_->setImage(*image, &error))
        return ActionResult::failed(QStringLiteral("clipboard write failed (%1)").arg(error));

    BOOST_LOG_TRIVIAL(debug) << "[ActionDispatcher] copied " << image->width << "x"
                             << image->height << " via " << decoderName.toStdString();
    return ActionResult::copied(QStringLiteral("image"));
}

ActionResult ActionDispatcher::copyText(const QString& text)
{
    QString error;
    if (!clipboard_ || !clipboard_->setText(text, &error))
        return ActionResult::failed(QStringLiteral("clipboard write failed (%1)").arg(error));
    return ActionResult::copied(QStringLiteral("text"));
}

// --- DispatchWorker ---

void ActionDispatcher::DispatchWorker::enqueue(const ActionRequest& request)
{
    QMutexLocker locker(&mutex_);
    queue_.push(request);
    condition_.wakeOne();
}

void ActionDispatcher::DispatchWorker::requestStop()
{
    QMutexLocker locker(&mutex_);
    stopRequested_ = true;
    condition_.wakeOne();
}

void ActionDispatcher::DispatchWorker::run()
{
    while (true) {
        ActionRequest request;
        {
            QMutexLocker locker(&mutex_);
            while (queue_.empty() && !stopRequested_)
                condition_.wait(&mutex_);
            if (stopRequested_)
                return;
            request = std::move(queue_.front());
            queue_.pop();
        }
        dispatcher_->dispatch(request);
    }
}

} // namespace fastsync
