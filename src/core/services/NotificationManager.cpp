#include "core/services/NotificationManager.hpp"
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QSaveFile>
#include <QTimer>
#include <algorithm>
#include <atomic>

namespace fastsync {

namespace {

std::atomic<qint64> lastStamp{0};

qint64 nextStamp()
{
    const qint64 now = QDateTime::currentMSecsSinceEpoch();
    qint64 prev = lastStamp.load();
    qint64 next;
    do {
        next = std::max(now, prev + 1);
    } while (!lastStamp.compare_exchange_weak(prev, next));
    return next;
}

const char* extensionFor(const QByteArray& bytes)
{
    if (bytes.startsWith("\xFF\xD8\xFF")) return "jpg";
    if (bytes.startsWith("\x89PNG")) return "png";
    if (bytes.startsWith("GIF8")) return "gif";
    if (bytes.startsWith("RIFF") && bytes.mid(8, 4) == "WEBP") return "webp";
    if (bytes.startsWith("BM")) return "bmp";
    return "png";
}

} // namespace

NotificationManager::NotificationManager(std::shared_ptr<NotificationRegistry> registry,
                                         INotificationSurface* surface,
                                         IActionSink* sink,
                                         const Options& options,
                                         QObject* parent)
    : QObject(parent)
    , registry_(std::move(registry))
    , surface_(surface)
    , sink_(sink)
    , options_(options)
    , builder_(options.descriptor)
{
    qRegisterMetaType<fastsync::ActionRequest>();
    qRegisterMetaType<fastsync::ActionResult>();

    if (surface_)
        connect(surface_, &INotificationSurface::actionInvoked,
                this, &NotificationManager::onActionInvoked);
}

QString NotificationManager::stagedFileName(const QByteArray& bytes)
{
    return QStringLiteral("fastsync_%1.%2").arg(nextStamp()).arg(QLatin1String(extensionFor(bytes)));
}

QString NotificationManager::stageImage(const QByteArray& bytes, QString* error) const
{
    const QString dir = options_.tempDir.isEmpty() ? QDir::tempPath() : options_.tempDir;
    if (!QDir().mkpath(dir)) {
        if (error) *error = QStringLiteral("cannot create %1").arg(dir);
        return {};
    }

    const QString path = QDir(dir).filePath(stagedFileName(bytes));
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        if (error) *error = file.errorString();
        return {};
    }
    if (file.write(bytes) != bytes.size() || !file.commit()) {
        if (error) *error = file.errorString();
        return {};
    }
    return path;
}

std::optional<NotificationDescriptor> NotificationManager::prepare(const fsp::Payload& payload,
                                                                   QString* error) const
{
    auto shared = std::make_shared<const fsp::Payload>(payload);

    QString imagePath;
    if (const auto* photo = std::get_if<fsp::PhotoPayload>(shared.get())) {
        imagePath = stageImage(photo->bytes, error);
        if (imagePath.isEmpty())
            return std::nullopt;
    }

    return builder_.build(shared, imagePath);
}

void NotificationManager::discardStagedImage(const NotificationDescriptor& descriptor)
{
    if (descriptor.imagePath.isEmpty())
        return;
    const auto live = registry_->find(descriptor.tag);
    if (live && live->imagePath == descriptor.imagePath)
        return;
    if (!QFile::remove(descriptor.imagePath))
        qDebug() << "[Notifications] Could not remove" << descriptor.imagePath;
}

bool NotificationManager::post(const NotificationDescriptor& descriptor)
{
    if (!surface_ || !surface_->isAvailable()) {
        qWarning() << "[Notifications] Surface unavailable, dropping" << descriptor.tag;
        discardStagedImage(descriptor);
        return false;
    }

    const auto previous = registry_->find(descriptor.tag);
    const quint32 replacesId = previous ? previous->notificationId : 0;

    QString error;
    const quint32 id = surface_->show(descriptor, replacesId, &error);
    if (id == 0) {
        qWarning() << "[Notifications] Failed to show" << descriptor.tag << ":" << error;
        discardStagedImage(descriptor);
        return false;
    }

    LiveNotification entry;
    entry.notificationId = id;
    entry.tag = descriptor.tag;
    entry.expiry = descriptor.expiry;
    entry.payload = descriptor.originPayload;
    entry.imagePath = descriptor.imagePath;
    const auto replaced = registry_->insert(entry);

    if (replaced && !replaced->imagePath.isEmpty() && replaced->imagePath != entry.imagePath) {
        if (!QFile::remove(replaced->imagePath))
            qDebug() << "[Notifications] Could not remove" << replaced->imagePath;
    }

    qInfo() << "[Notifications] Posted" << descriptor.tag << "id" << id
            << (replacesId ? "(replaced)" : "");
    scheduleExpiry(descriptor.tag, id, descriptor.ttlMs);
    emit posted(descriptor.tag, id);
    return true;
}

void NotificationManager::scheduleExpiry(const QString& tag, quint32 notificationId, int ttlMs)
{
    if (ttlMs <= 0)
        return;
    QTimer::singleShot(ttlMs, this, [this, tag, notificationId]() {
        const auto live = registry_->find(tag);
        if (live && live->notificationId == notificationId && surface_) {
            qDebug() << "[Notifications] Expired" << tag << notificationId;
            surface_->close(notificationId);
        }
    });
}

void NotificationManager::schedule(const fsp::Payload& payload)
{
    QString error;
    auto descriptor = prepare(payload, &error);
    if (!descriptor) {
        qWarning() << "[Notifications] Failed to build notification:" << error;
        return;
    }

    NotificationDescriptor d = std::move(*descriptor);
    QMetaObject::invokeMethod(this, [this, d]() { post(d); }, Qt::QueuedConnection);
}

void NotificationManager::onActionInvoked(quint32 notificationId, const QString& actionId)
{
    if (notificationId == failureNoticeId_)
        return;

    // "default" is the body click, not one of our buttons
    if (actionId.isEmpty() || actionId == QLatin1String("default"))
        return;

    auto live = registry_->claimActivation(notificationId);
    if (!live) {
        qInfo() << "[Notifications] Dropping activation" << actionId
                << "for stale notification" << notificationId;
        return;
    }
    if (!live->payload) {
        qWarning() << "[Notifications] Notification" << notificationId << "has no payload";
        return;
    }

    qInfo() << "[Notifications]" << live->tag << "action" << actionId;
    if (sink_)
        sink_->submit({actionId, live->tag, live->payload});
}

void NotificationManager::onActionFinished(const ActionRequest& request, const ActionResult& result)
{
    if (result.isFailure())
        reportFailure(QStringLiteral("%1: %2").arg(request.actionId, result.detail));
}

void NotificationManager::reportFailure(const QString& reason)
{
    qWarning() << "[Notifications] Action failed:" << reason;
    if (!options_.reportFailures || !surface_ || !surface_->isAvailable())
        return;

    QString error;
    const quint32 id = surface_->show(builder_.buildFailureNotice(reason), failureNoticeId_, &error);
    if (id == 0)
        qWarning() << "[Notifications] Failed to show failure notice:" << error;
    else
        failureNoticeId_ = id;
}

} // namespace fastsync
