#pragma once

#include "core/services/NotificationDescriptor.hpp"
#include <QObject>

namespace fastsync {

/// The OS notification server. Ids are surface-assigned and nonzero.
/// Signals are delivered on the thread that owns the surface (the UI loop).
class INotificationSurface : public QObject {
    Q_OBJECT
public:
    using QObject::QObject;
    ~INotificationSurface() override = default;

    virtual bool isAvailable() const = 0;

    /// Display descriptor, replacing the notification replacesId when nonzero.
    /// Returns the id of the shown notification, 0 on failure.
    virtual quint32 show(const NotificationDescriptor& descriptor, quint32 replacesId,
                         QString* error = nullptr) = 0;

    virtual void close(quint32 notificationId) = 0;

signals:
    void actionInvoked(quint32 notificationId, const QString& actionId);
    void closed(quint32 notificationId, uint reason);
};

} // namespace fastsync
