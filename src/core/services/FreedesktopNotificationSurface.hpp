#pragma once

#include "core/services/INotificationSurface.hpp"

namespace fastsync {

/// org.freedesktop.Notifications on the session bus.
class FreedesktopNotificationSurface : public INotificationSurface {
    Q_OBJECT
public:
    FreedesktopNotificationSurface(const QString& appName, const QString& desktopEntry,
                                   QObject* parent = nullptr);

    bool isAvailable() const override;
    quint32 show(const NotificationDescriptor& descriptor, quint32 replacesId,
                 QString* error = nullptr) override;
    void close(quint32 notificationId) override;

    /// Flattened [id, label, id, label, ...] list the Notify call expects.
    static QStringList actionList(const NotificationDescriptor& descriptor);

private slots:
    void onActionInvoked(uint id, const QString& actionKey);
    void onNotificationClosed(uint id, uint reason);

private:
    QString appName_;
    QString desktopEntry_;
    bool bodyMarkup_ = false;
    bool subscribed_ = false;

    void subscribe();
};

} // namespace fastsync
