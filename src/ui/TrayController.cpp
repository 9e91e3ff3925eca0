#include "ui/TrayController.hpp"
#include <QAction>
#include <QDebug>
#include <QIcon>
#include <QMessageBox>

namespace fastsync {

TrayController::TrayController(const QString& displayName, AddressProvider addressProvider,
                               QObject* parent)
    : QObject(parent)
    , displayName_(displayName)
    , addressProvider_(std::move(addressProvider))
{
    statusAction_ = menu_.addAction(statusText());
    connect(statusAction_, &QAction::triggered, this, &TrayController::showStatusPopup);
    menu_.addSeparator();
    quitAction_ = menu_.addAction(tr("Quit"));
    connect(quitAction_, &QAction::triggered, this, &TrayController::quitRequested);

    // Address can change while we run (DHCP, Wi-Fi switch)
    connect(&menu_, &QMenu::aboutToShow, this, &TrayController::refreshStatus);

    trayIcon_.setIcon(QIcon::fromTheme("image-x-generic"));
    trayIcon_.setToolTip(displayName_);
    trayIcon_.setContextMenu(&menu_);
    connect(&trayIcon_, &QSystemTrayIcon::activated, this, &TrayController::onTrayActivated);
}

bool TrayController::show()
{
    if (!QSystemTrayIcon::isSystemTrayAvailable()) {
        qWarning() << "[Tray] No system tray available";
        return false;
    }
    trayIcon_.show();
    return true;
}

QString TrayController::statusTextFor(const std::optional<QString>& ip)
{
    return QStringLiteral("FastSync running - IP: %1").arg(ip ? *ip : QStringLiteral("Unknown"));
}

QString TrayController::statusText() const
{
    return statusTextFor(addressProvider_ ? addressProvider_() : std::nullopt);
}

void TrayController::refreshStatus()
{
    statusAction_->setText(statusText());
}

void TrayController::showStatusPopup()
{
    auto* box = new QMessageBox(QMessageBox::Information, QStringLiteral("FastSync Info"),
                                statusText(), QMessageBox::Ok);
    box->setAttribute(Qt::WA_DeleteOnClose);
    box->setModal(false);
    box->show();
}

void TrayController::onTrayActivated(QSystemTrayIcon::ActivationReason reason)
{
    if (reason == QSystemTrayIcon::Trigger)
        showStatusPopup();
}

} // namespace fastsync
