#include "core/services/NotificationRegistry.hpp"
#include <QMutexLocker>

namespace fastsync {

std::optional<LiveNotification> NotificationRegistry::insert(const LiveNotification& entry)
{
    QMutexLocker lock(&mutex_);
    std::optional<LiveNotification> previous;
    auto it = entries_.find(entry.tag);
    if (it != entries_.end())
        previous = it.value();
    entries_.insert(entry.tag, entry);
    return previous;
}

std::optional<LiveNotification> NotificationRegistry::find(const QString& tag) const
{
    QMutexLocker lock(&mutex_);
    auto it = entries_.constFind(tag);
    if (it == entries_.constEnd())
        return std::nullopt;
    return it.value();
}

std::optional<LiveNotification> NotificationRegistry::findByNotificationId(quint32 notificationId) const
{
    if (notificationId == 0)
        return std::nullopt;
    QMutexLocker lock(&mutex_);
    for (const auto& entry : entries_) {
        if (entry.notificationId == notificationId)
            return entry;
    }
    return std::nullopt;
}

std::optional<LiveNotification> NotificationRegistry::claimActivation(quint32 notificationId)
{
    if (notificationId == 0)
        return std::nullopt;
    QMutexLocker lock(&mutex_);
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->notificationId != notificationId)
            continue;
        if (it->activated)
            return std::nullopt;
        it->activated = true;
        return it.value();
    }
    return std::nullopt;
}

bool NotificationRegistry::contains(const QString& tag) const
{
    QMutexLocker lock(&mutex_);
    return entries_.contains(tag);
}

int NotificationRegistry::size() const
{
    QMutexLocker lock(&mutex_);
    return static_cast<int>(entries_.size());
}

} // namespace fastsync
