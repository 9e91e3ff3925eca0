#include "core/services/FreedesktopNotificationSurface.hpp"
#include <QDBusConnection>
#include <QDBusConnectionInterface>
#include <QDBusInterface>
#include <QDBusReply>
#include <QDebug>
#include <QUrl>

namespace fastsync {

namespace {
const char* kService = "org.freedesktop.Notifications";
const char* kPath = "/org/freedesktop/Notifications";
const char* kInterface = "org.freedesktop.Notifications";
} // namespace

FreedesktopNotificationSurface::FreedesktopNotificationSurface(const QString& appName,
                                                               const QString& desktopEntry,
                                                               QObject* parent)
    : INotificationSurface(parent)
    , appName_(appName)
    , desktopEntry_(desktopEntry)
{
    if (!isAvailable()) {
        qWarning() << "[Notifications] No notification server on the session bus";
        return;
    }

    QDBusInterface server(kService, kPath, kInterface, QDBusConnection::sessionBus());
    QDBusReply<QStringList> caps = server.call("GetCapabilities");
    if (caps.isValid()) {
        bodyMarkup_ = caps.value().contains("body-markup");
        qInfo() << "[Notifications] Server capabilities:" << caps.value();
    }
    subscribe();
}

void FreedesktopNotificationSurface::subscribe()
{
    if (subscribed_) return;

    auto bus = QDBusConnection::sessionBus();
    bool ok = bus.connect(kService, kPath, kInterface, "ActionInvoked",
                          this, SLOT(onActionInvoked(uint,QString)));
    ok = bus.connect(kService, kPath, kInterface, "NotificationClosed",
                     this, SLOT(onNotificationClosed(uint,uint))) && ok;
    if (!ok)
        qWarning() << "[Notifications] Failed to subscribe to server signals";
    subscribed_ = ok;
}

bool FreedesktopNotificationSurface::isAvailable() const
{
    auto bus = QDBusConnection::sessionBus();
    if (!bus.isConnected() || !bus.interface())
        return false;
    return bus.interface()->isServiceRegistered(kService).value();
}

QStringList FreedesktopNotificationSurface::actionList(const NotificationDescriptor& descriptor)
{
    QStringList list;
    for (const auto& action : descriptor.actions)
        list << action.actionId << action.label;
    return list;
}

quint32 FreedesktopNotificationSurface::show(const NotificationDescriptor& descriptor,
                                             quint32 replacesId, QString* error)
{
    QDBusInterface server(kService, kPath, kInterface, QDBusConnection::sessionBus());
    if (!server.isValid()) {
        if (error) *error = QStringLiteral("notification server unavailable");
        return 0;
    }
    subscribe();

    QVariantMap hints;
    if (!desktopEntry_.isEmpty())
        hints["desktop-entry"] = desktopEntry_;
    if (!descriptor.imagePath.isEmpty())
        hints["image-path"] = QUrl::fromLocalFile(descriptor.imagePath).toString();
    hints["category"] = descriptor.tag == tags::SMS ? QStringLiteral("im.received")
                                                    : QStringLiteral("transfer.complete");
    hints["x-fastsync-group"] = descriptor.group;
    hints["x-fastsync-tag"] = descriptor.tag;
    if (descriptor.actions.isEmpty())
        hints["transient"] = true;

    // Summary is never markup; the body only when the server renders it
    const QString summary = NotificationText::unescapeMarkup(descriptor.title);
    const QString body = bodyMarkup_ ? descriptor.bodyPreview
                                     : NotificationText::unescapeMarkup(descriptor.bodyPreview);

    QDBusReply<uint> reply = server.call("Notify",
        appName_,
        static_cast<uint>(replacesId),
        QString(),
        summary,
        body,
        actionList(descriptor),
        hints,
        static_cast<int>(descriptor.ttlMs));

    if (!reply.isValid()) {
        if (error) *error = reply.error().message();
        return 0;
    }
    return reply.value();
}

void FreedesktopNotificationSurface::close(quint32 notificationId)
{
    QDBusInterface server(kService, kPath, kInterface, QDBusConnection::sessionBus());
    QDBusReply<void> reply = server.call("CloseNotification", static_cast<uint>(notificationId));
    if (!reply.isValid())
        qDebug() << "[Notifications] CloseNotification" << notificationId << "failed:"
                 << reply.error().message();
}

void FreedesktopNotificationSurface::onActionInvoked(uint id, const QString& actionKey)
{
    emit actionInvoked(id, actionKey);
}

void FreedesktopNotificationSurface::onNotificationClosed(uint id, uint reason)
{
    emit closed(id, reason);
}

} // namespace fastsync
