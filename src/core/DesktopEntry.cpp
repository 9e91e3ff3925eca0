#include "core/DesktopEntry.hpp"
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QSaveFile>
#include <QStandardPaths>

namespace fastsync {

QString desktopEntryContent(const QString& displayName, const QString& executablePath)
{
    QString exec = executablePath;
    if (exec.contains(' '))
        exec = '"' + exec + '"';

    return QStringLiteral(
        "[Desktop Entry]\n"
        "Type=Application\n"
        "Name=%1\n"
        "Exec=%2\n"
        "Icon=image-x-generic\n"
        "Terminal=false\n"
        "NoDisplay=true\n"
        "X-GNOME-UsesNotifications=true\n").arg(displayName, exec);
}

QString installDesktopEntry(const QString& appId, const QString& displayName,
                            const QString& executablePath, const QString& applicationsDir)
{
    const QString dir = applicationsDir.isEmpty()
        ? QStandardPaths::writableLocation(QStandardPaths::ApplicationsLocation)
        : applicationsDir;
    if (dir.isEmpty() || !QDir().mkpath(dir)) {
        qWarning() << "[DesktopEntry] No writable applications directory";
        return {};
    }

    const QString path = QDir(dir).filePath(appId + ".desktop");
    const QByteArray content = desktopEntryContent(displayName, executablePath).toUtf8();

    QFile existing(path);
    if (existing.open(QIODevice::ReadOnly) && existing.readAll() == content)
        return path;
    existing.close();

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly) || file.write(content) != content.size() || !file.commit()) {
        qWarning() << "[DesktopEntry] Cannot write" << path << ":" << file.errorString();
        return {};
    }
    qInfo() << "[DesktopEntry] Installed" << path;
    return path;
}

} // namespace fastsync
