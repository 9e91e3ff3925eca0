#pragma once

#include <QList>
#include <QString>
#include <optional>

namespace fastsync {

struct InterfaceAddress {
    QString name;   // OS interface name, e.g. "eth0", "docker0"
    QString ip;     // dotted IPv4
};

/// Picks the LAN address a companion device on the same network is most
/// likely to reach. Used by discovery and by the tray status entry.
class LocalAddressSelector {
public:
    /// 192.168.* > 10.* / 172.* > anything else. Loopback and link-local
    /// are never returned. Within a rank a physical interface beats a
    /// virtual one; remaining ties keep enumeration order.
    static std::optional<QString> selectBestAddress(const QList<InterfaceAddress>& candidates);

    static int rank(const QString& ip);
    static bool isVirtualInterface(const QString& name);

    /// All IPv4 addresses of interfaces that are up, in OS order.
    static QList<InterfaceAddress> enumerateIPv4();

    static std::optional<QString> currentBestAddress();
};

} // namespace fastsync
