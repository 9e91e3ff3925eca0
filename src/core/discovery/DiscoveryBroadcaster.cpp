#include "core/discovery/DiscoveryBroadcaster.hpp"
#include "core/net/LocalAddressSelector.hpp"
#include <QByteArrayList>
#include <QDBusConnection>
#include <QDBusInterface>
#include <QDBusMetaType>
#include <QDBusReply>
#include <QDebug>
#include <QStringList>
#include <QSysInfo>

namespace fastsync {

namespace {

const char* kAvahiService = "org.freedesktop.Avahi";
const char* kServerInterface = "org.freedesktop.Avahi.Server";
const char* kEntryGroupInterface = "org.freedesktop.Avahi.EntryGroup";

// avahi-common/defs.h
constexpr int AVAHI_IF_UNSPEC = -1;
constexpr int AVAHI_PROTO_INET = 0;
constexpr uint AVAHI_PUBLISH_NO_REVERSE = 0x20;

void setError(QString* error, const QString& message)
{
    if (error) *error = message;
}

} // namespace

DiscoveryBroadcaster::DiscoveryBroadcaster(const QString& serviceType, const QString& instanceSuffix)
    : serviceType_(serviceType)
    , instanceSuffix_(instanceSuffix)
{
}

ServiceRecord DiscoveryBroadcaster::makeServiceRecord(const QString& hostname, const QString& ip,
                                                      uint16_t port, const QString& serviceType,
                                                      const QString& instanceSuffix)
{
    ServiceRecord record;
    record.instanceName = hostname + instanceSuffix;
    record.hostName = record.instanceName + ".local";
    record.ip = ip;
    record.port = port;

    QString type = serviceType;
    while (type.endsWith('.'))
        type.chop(1);
    // "_photosync._tcp.local" -> type "_photosync._tcp", domain "local"
    const QStringList labels = type.split('.', Qt::SkipEmptyParts);
    if (labels.size() > 2) {
        record.serviceType = labels.mid(0, 2).join('.');
        record.domain = labels.mid(2).join('.');
    } else {
        record.serviceType = type;
        record.domain = QStringLiteral("local");
    }
    return record;
}

QString DiscoveryBroadcaster::localHostName()
{
    QString host = QSysInfo::machineHostName().trimmed();
    // Drop any domain part; mDNS adds its own
    host = host.section('.', 0, 0);
    if (host.isEmpty())
        return QStringLiteral("fast-sync-pc");
    return host;
}

bool DiscoveryBroadcaster::start(uint16_t port, QString* error)
{
    const auto ip = LocalAddressSelector::currentBestAddress();
    if (!ip) {
        qWarning() << "[Discovery] No usable LAN address, not advertising";
        setError(error, QStringLiteral("no usable IPv4 address"));
        return false;
    }

    const ServiceRecord record = makeServiceRecord(localHostName(), *ip, port,
                                                   serviceType_, instanceSuffix_);
    return registerService(record, error);
}

bool DiscoveryBroadcaster::registerService(const ServiceRecord& record, QString* error)
{
    auto bus = QDBusConnection::systemBus();
    if (!bus.isConnected()) {
        qWarning() << "[Discovery] System bus unavailable";
        setError(error, QStringLiteral("system bus unavailable"));
        return false;
    }

    QDBusInterface server(kAvahiService, "/", kServerInterface, bus);
    QDBusReply<QDBusObjectPath> groupReply = server.call("EntryGroupNew");
    if (!groupReply.isValid()) {
        qWarning() << "[Discovery] Avahi EntryGroupNew failed:" << groupReply.error().message();
        setError(error, groupReply.error().message());
        return false;
    }
    entryGroup_ = groupReply.value();

    QDBusInterface group(kAvahiService, entryGroup_.path(), kEntryGroupInterface, bus);

    // Our own A record, so the instance host resolves to the chosen LAN address
    QDBusReply<void> addrReply = group.call("AddAddress",
        AVAHI_IF_UNSPEC, AVAHI_PROTO_INET, AVAHI_PUBLISH_NO_REVERSE,
        record.hostName, record.ip);
    if (!addrReply.isValid()) {
        qWarning() << "[Discovery] AddAddress" << record.hostName << record.ip
                   << "failed:" << addrReply.error().message();
        setError(error, addrReply.error().message());
        return false;
    }

    qDBusRegisterMetaType<QByteArrayList>();
    QByteArrayList txt;
    QDBusReply<void> svcReply = group.call("AddService",
        AVAHI_IF_UNSPEC, AVAHI_PROTO_INET, 0u,
        record.instanceName, record.serviceType, record.domain, record.hostName,
        QVariant::fromValue(static_cast<quint16>(record.port)),
        QVariant::fromValue(txt));
    if (!svcReply.isValid()) {
        qWarning() << "[Discovery] AddService failed:" << svcReply.error().message();
        setError(error, svcReply.error().message());
        return false;
    }

    QDBusReply<void> commitReply = group.call("Commit");
    if (!commitReply.isValid()) {
        qWarning() << "[Discovery] Commit failed:" << commitReply.error().message();
        setError(error, commitReply.error().message());
        return false;
    }

    published_ = record;
    qInfo() << "[Discovery] Advertising" << record.instanceName << record.serviceType
            << "at" << record.hostName << record.ip << "port" << record.port;
    return true;
}

} // namespace fastsync
