#pragma once

#include "core/services/IActionSink.hpp"
#include "core/services/INotificationSurface.hpp"
#include "core/services/NotificationDescriptor.hpp"
#include "core/services/NotificationRegistry.hpp"
#include <QObject>
#include <memory>
#include <optional>

namespace fastsync {

/// Owns every notification from descriptor to expiry. prepare() and
/// schedule() may run on any thread; everything touching the surface runs
/// on the thread the manager lives on.
class NotificationManager : public QObject {
    Q_OBJECT
public:
    struct Options {
        DescriptorBuilder::Options descriptor;
        QString tempDir;            // empty: QDir::tempPath()
        bool reportFailures = true;
    };

    NotificationManager(std::shared_ptr<NotificationRegistry> registry,
                        INotificationSurface* surface,
                        IActionSink* sink,
                        const Options& options,
                        QObject* parent = nullptr);

    /// Stage photo bytes to disk and build the descriptor.
    std::optional<NotificationDescriptor> prepare(const fsp::Payload& payload,
                                                  QString* error = nullptr) const;

    /// Show descriptor, replacing the live notification with the same tag.
    bool post(const NotificationDescriptor& descriptor);

    /// prepare() here, post() queued onto the manager's thread.
    void schedule(const fsp::Payload& payload);

    /// Short non-interactive toast for a failed action.
    void reportFailure(const QString& reason);

    std::shared_ptr<NotificationRegistry> registry() const { return registry_; }

    /// fastsync_<epoch ms>.<ext>; the stamp is strictly increasing per process.
    static QString stagedFileName(const QByteArray& bytes);

public slots:
    void onActionInvoked(quint32 notificationId, const QString& actionId);
    void onActionFinished(const fastsync::ActionRequest& request,
                          const fastsync::ActionResult& result);

signals:
    void posted(const QString& tag, quint32 notificationId);

private:
    std::shared_ptr<NotificationRegistry> registry_;
    INotificationSurface* surface_;
    IActionSink* sink_;
    Options options_;
    DescriptorBuilder builder_;
    quint32 failureNoticeId_ = 0;

    QString stageImage(const QByteArray& bytes, QString* error) const;
    void discardStagedImage(const NotificationDescriptor& descriptor);
    void scheduleExpiry(const QString& tag, quint32 notificationId, int ttlMs);
};

} // namespace fastsync
