#include "core/net/LocalAddressSelector.hpp"
#include <QHostAddress>
#include <QNetworkInterface>
#include <QStringList>

namespace fastsync {

namespace {

const QStringList& virtualFragments()
{
    static const QStringList fragments = {
        "wsl", "docker", "vethernet", "tailscale", "meta", "loopback",
        "veth", "br-", "virbr", "vmnet", "vboxnet", "tun", "tap",
        "wg", "zt", "utun"
    };
    return fragments;
}

bool isExcluded(const QString& ip)
{
    return ip.startsWith("127.") || ip.startsWith("169.254.");
}

} // namespace

int LocalAddressSelector::rank(const QString& ip)
{
    if (ip.startsWith("192.168.")) return 3;
    if (ip.startsWith("10.") || ip.startsWith("172.")) return 2;
    return 1;
}

bool LocalAddressSelector::isVirtualInterface(const QString& name)
{
    const QString lower = name.toLower();
    for (const auto& fragment : virtualFragments()) {
        if (lower.contains(fragment))
            return true;
    }
    return false;
}

std::optional<QString> LocalAddressSelector::selectBestAddress(const QList<InterfaceAddress>& candidates)
{
    const InterfaceAddress* best = nullptr;
    int bestRank = 0;
    bool bestPhysical = false;

    for (const auto& candidate : candidates) {
        if (candidate.ip.isEmpty() || isExcluded(candidate.ip))
            continue;

        const int r = rank(candidate.ip);
        const bool physical = !isVirtualInterface(candidate.name);

        // Strict comparison keeps the first-encountered entry on ties
        if (!best || r > bestRank || (r == bestRank && physical && !bestPhysical)) {
            best = &candidate;
            bestRank = r;
            bestPhysical = physical;
        }
    }

    if (!best)
        return std::nullopt;
    return best->ip;
}

QList<InterfaceAddress> LocalAddressSelector::enumerateIPv4()
{
    QList<InterfaceAddress> result;
    for (const auto& iface : QNetworkInterface::allInterfaces()) {
        if (!(iface.flags() & QNetworkInterface::IsUp))
            continue;
        for (const auto& entry : iface.addressEntries()) {
            const QHostAddress ip = entry.ip();
            if (ip.protocol() != QAbstractSocket::IPv4Protocol)
                continue;
            result.append(InterfaceAddress{iface.name(), ip.toString()});
        }
    }
    return result;
}

std::optional<QString> LocalAddressSelector::currentBestAddress()
{
    return selectBestAddress(enumerateIPv4());
}

} // namespace fastsync
