#pragma once

#include <QMenu>
#include <QObject>
#include <QSystemTrayIcon>
#include <functional>
#include <optional>

namespace fastsync {

/// Tray icon with a status line and Quit. Clicking the icon shows the same
/// status in a non-modal box.
class TrayController : public QObject {
    Q_OBJECT
public:
    using AddressProvider = std::function<std::optional<QString>()>;

    explicit TrayController(const QString& displayName, AddressProvider addressProvider,
                            QObject* parent = nullptr);

    bool show();
    QString statusText() const;

    static QString statusTextFor(const std::optional<QString>& ip);

signals:
    void quitRequested();

private slots:
    void showStatusPopup();
    void onTrayActivated(QSystemTrayIcon::ActivationReason reason);

private:
    QString displayName_;
    AddressProvider addressProvider_;
    QSystemTrayIcon trayIcon_;
    QMenu menu_;
    QAction* statusAction_ = nullptr;
    QAction* quitAction_ = nullptr;

    void refreshStatus();
};

} // namespace fastsync
