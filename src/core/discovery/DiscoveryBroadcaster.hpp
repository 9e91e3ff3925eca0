#pragma once

#include <QDBusObjectPath>
#include <QString>
#include <optional>

namespace fastsync {

struct ServiceRecord {
    QString instanceName;   // "<hostname>_fastsync"
    QString hostName;       // "<instanceName>.local"
    QString serviceType;    // "_photosync._tcp", no domain
    QString domain;         // "local"
    QString ip;
    uint16_t port = 0;
};

/// Announces the receiver over mDNS/DNS-SD through the Avahi daemon's
/// D-Bus API. One record, registered once; Avahi withdraws it when the
/// process drops off the system bus.
class DiscoveryBroadcaster {
public:
    DiscoveryBroadcaster(const QString& serviceType, const QString& instanceSuffix);

    /// Split "_photosync._tcp.local." into type and domain, derive names.
    static ServiceRecord makeServiceRecord(const QString& hostname, const QString& ip,
                                           uint16_t port, const QString& serviceType,
                                           const QString& instanceSuffix);

    /// Machine host name, or "fast-sync-pc" when the OS gives none.
    static QString localHostName();

    /// Pick the LAN address and register. A missing address or daemon is
    /// logged and reported as false; the caller keeps running.
    bool start(uint16_t port, QString* error = nullptr);

    bool registerService(const ServiceRecord& record, QString* error = nullptr);

    std::optional<ServiceRecord> published() const { return published_; }

private:
    QString serviceType_;
    QString instanceSuffix_;
    QDBusObjectPath entryGroup_;
    std::optional<ServiceRecord> published_;
};

} // namespace fastsync
