#pragma once

#include <QString>

namespace fastsync {

/// Writes <appId>.desktop so the notification server can attribute our
/// notifications. Rewrites only when the content differs.
/// Returns the entry path, or an empty string on failure.
QString installDesktopEntry(const QString& appId, const QString& displayName,
                            const QString& executablePath,
                            const QString& applicationsDir = QString());

QString desktopEntryContent(const QString& displayName, const QString& executablePath);

} // namespace fastsync
