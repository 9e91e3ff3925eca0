#include <QDebug>
#include <QFile>
#include <memory>
#include <boost/log/trivial.hpp>
#include "core/DesktopEntry.hpp"
#include "core/Logging.hpp"
#include "core/ReceiverConfig.hpp"
#include "core/discovery/DiscoveryBroadcaster.hpp"
#include "core/gateway/IngestionGateway.hpp"
#include "core/image/ImageDecoderChain.hpp"
#include "core/net/LocalAddressSelector.hpp"
#include "core/services/ActionDispatcher.hpp"
#include "core/services/FreedesktopNotificationSurface.hpp"
#include "core/services/NotificationManager.hpp"
#include "core/services/NotificationRegistry.hpp"
#include "core/services/SystemClipboard.hpp"
#include "ui/ReceiverApplication.hpp"
#include "ui/TrayController.hpp"

int main(int argc, char *argv[])
{
    fastsync::ReceiverApplication app(argc, argv);
    fastsync::ReceiverApplication::installFatalErrorHandler();
    app.setApplicationName("FastSync");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("FastSync");
    app.setQuitOnLastWindowClosed(false);   // tray-only, dialogs come and go

    // --- Configuration ---
    fastsync::ReceiverConfig config;
    const QString configPath = fastsync::ReceiverConfig::defaultPath();
    if (QFile::exists(configPath)) {
        config.load(configPath);
    } else if (config.save(configPath)) {
        qInfo() << "[Main] Wrote default config to" << configPath;
    }

    const QString level = fastsync::initLogging(config.logLevel());
    qInfo() << "[Main] FastSync receiver starting, log level" << level;

    // --- OS identity ---
    app.setDesktopFileName(config.appId());
    fastsync::installDesktopEntry(config.appId(), config.displayName(),
                                  QCoreApplication::applicationFilePath());

    // --- Notification pipeline ---
    auto registry = std::make_shared<fastsync::NotificationRegistry>();
    auto* surface = new fastsync::FreedesktopNotificationSurface(config.appName(), config.appId(), &app);

    fastsync::SystemClipboard clipboard;
    fastsync::SaveDialogProvider saveDialog;
    auto* dispatcher = new fastsync::ActionDispatcher(&clipboard, &saveDialog,
                                                      fastsync::ImageDecoderChain::createDefault(),
                                                      config.defaultSaveFileName(), &app);

    fastsync::NotificationManager::Options notifyOptions;
    notifyOptions.descriptor.previewChars = config.previewChars();
    notifyOptions.descriptor.photoTtlMs = config.photoTtlMs();
    notifyOptions.descriptor.smsTtlMs = config.smsTtlMs();
    notifyOptions.descriptor.clipboardTtlMs = config.clipboardTtlMs();
    notifyOptions.tempDir = config.tempDir();
    notifyOptions.reportFailures = config.reportFailures();
    auto* manager = new fastsync::NotificationManager(registry, surface, dispatcher, notifyOptions, &app);

    QObject::connect(dispatcher, &fastsync::ActionDispatcher::actionFinished,
                     manager, &fastsync::NotificationManager::onActionFinished);
    dispatcher->start();

    // --- Ingestion gateway ---
    fastsync::IngestionGateway::Options gatewayOptions;
    gatewayOptions.bindAddress = config.bindAddress();
    gatewayOptions.port = config.port();
    gatewayOptions.maxBodyBytes = static_cast<std::size_t>(config.maxBodyBytes());
    gatewayOptions.threadCount = config.workerThreads();
    gatewayOptions.readTimeoutMs = config.readTimeoutMs();

    fastsync::IngestionGateway gateway(gatewayOptions, [manager](const fsp::Payload& payload) {
        manager->schedule(payload);
    });
    QString gatewayError;
    if (!gateway.start(&gatewayError)) {
        fastsync::ReceiverApplication::reportFatal(
            QStringLiteral("Cannot listen on %1:%2\n%3")
                .arg(gatewayOptions.bindAddress).arg(gatewayOptions.port).arg(gatewayError));
    }

    // --- Discovery ---
    std::unique_ptr<fastsync::DiscoveryBroadcaster> discovery;
    if (config.discoveryEnabled()) {
        discovery = std::make_unique<fastsync::DiscoveryBroadcaster>(config.serviceType(),
                                                                     config.instanceSuffix());
        QString discoveryError;
        if (!discovery->start(gateway.localPort(), &discoveryError))
            qWarning() << "[Main] Discovery disabled:" << discoveryError;
    }

    // --- Tray ---
    fastsync::TrayController tray(config.displayName(),
                                  &fastsync::LocalAddressSelector::currentBestAddress);
    QObject::connect(&tray, &fastsync::TrayController::quitRequested, &app, &QCoreApplication::quit);
    tray.show();

    int ret = app.exec();

    // Stop producers before the consumers they post to
    gateway.stop();
    dispatcher->stop();
    BOOST_LOG_TRIVIAL(info) << "[Main] Shutdown complete";
    return ret;
}
