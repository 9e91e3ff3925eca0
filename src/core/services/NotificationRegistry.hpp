#pragma once

#include <fsp/Payload/Payload.hpp>
#include <QDateTime>
#include <QHash>
#include <QMutex>
#include <QString>
#include <memory>
#include <optional>

namespace fastsync {

struct LiveNotification {
    quint32 notificationId = 0;
    QString tag;
    QDateTime expiry;
    std::shared_ptr<const fsp::Payload> payload;
    QString imagePath;
    bool activated = false;
};

/// Process-wide store of the live notification per tag. One entry per tag,
/// replaced on every post and never evicted. The lock is held for a single
/// lookup or update only.
class NotificationRegistry {
public:
    /// Store entry under its tag and return whatever it replaced.
    std::optional<LiveNotification> insert(const LiveNotification& entry);

    std::optional<LiveNotification> find(const QString& tag) const;
    std::optional<LiveNotification> findByNotificationId(quint32 notificationId) const;

    /// Marks the notification activated and returns it, or std::nullopt when
    /// the id is no longer the live one for its tag or was already activated.
    std::optional<LiveNotification> claimActivation(quint32 notificationId);

    bool contains(const QString& tag) const;
    int size() const;

private:
    mutable QMutex mutex_;
    QHash<QString, LiveNotification> entries_;
};

} // namespace fastsync
