#include "core/bus/ResolvedBus.hpp"
#include "core/discovery/ServiceInstance.hpp"
#include <QDBusArgument>
#include <QDBusPendingCall>
#include <QDBusPendingCallWatcher>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(lcResolvedBus, "rsb.bus.resolved")

namespace rsb {

static const QString kService = QStringLiteral("org.freedesktop.resolve1");
static const QString kPath = QStringLiteral("/org/freedesktop/resolve1");
static const QString kManagerInterface = QStringLiteral("org.freedesktop.resolve1.Manager");

ResolvedBus::ResolvedBus(int timeoutMs, QObject* parent)
    : ResolvedBus(QDBusConnection::systemBus(), timeoutMs, parent)
{
}

ResolvedBus::ResolvedBus(const QDBusConnection& connection, int timeoutMs, QObject* parent)
    : QObject(parent)
    , connection_(connection)
    , timeoutMs_(timeoutMs)
{
}

bool ResolvedBus::isConnected() const
{
    return connection_.isConnected();
}

BusError ResolvedBus::classifyError(const QString& errorName, const QString& message)
{
    BusError error;
    error.name = errorName;
    error.message = message;

    if (errorName == QLatin1String("org.freedesktop.DBus.Error.ServiceUnknown") ||
        errorName == QLatin1String("org.freedesktop.DBus.Error.NameHasNoOwner") ||
        errorName == QLatin1String("org.freedesktop.DBus.Error.Disconnected") ||
        errorName == QLatin1String("org.freedesktop.DBus.Error.NoServer") ||
        errorName == QLatin1String("org.freedesktop.resolve1.NoNameServers") ||
        errorName == QLatin1String("org.freedesktop.resolve1.NetworkDown")) {
        error.kind = BusErrorKind::Unreachable;
    } else if (errorName == QLatin1String("org.freedesktop.DBus.Error.NoReply") ||
               errorName == QLatin1String("org.freedesktop.DBus.Error.Timeout") ||
               errorName == QLatin1String("org.freedesktop.DBus.Error.TimedOut")) {
        error.kind = BusErrorKind::Timeout;
    } else if (errorName == QLatin1String("org.freedesktop.resolve1.NoSuchResourceRecord") ||
               errorName == QLatin1String("org.freedesktop.resolve1.NoSuchService") ||
               errorName == QLatin1String("org.freedesktop.resolve1.DnsError.NXDOMAIN")) {
        error.kind = BusErrorKind::NotFound;
    } else if (errorName == QLatin1String("org.freedesktop.resolve1.DnsError.FORMERR") ||
               errorName == QLatin1String("org.freedesktop.resolve1.InvalidReply") ||
               errorName == QLatin1String("org.freedesktop.DBus.Error.InvalidArgs")) {
        error.kind = BusErrorKind::Malformed;
    } else if (errorName.startsWith(QLatin1String("org.freedesktop.resolve1.DnsError."))) {
        // SERVFAIL, REFUSED and the like; the responder may recover
        error.kind = BusErrorKind::NotFound;
    } else {
        error.kind = BusErrorKind::Malformed;
    }
    return error;
}

static BusError malformed(const QString& message)
{
    BusError error;
    error.kind = BusErrorKind::Malformed;
    error.message = message;
    return error;
}

BusError ResolvedBus::decodeRecordReply(const QDBusMessage& reply, QList<BusRecord>* records)
{
    const QList<QVariant> args = reply.arguments();
    if (args.size() < 2 || !args.at(0).canConvert<QDBusArgument>())
        return malformed(QStringLiteral("ResolveRecord: unexpected reply shape"));

    const QDBusArgument arg = args.at(0).value<QDBusArgument>();
    if (arg.currentSignature() != QLatin1String("a(iqqay)"))
        return malformed(QStringLiteral("ResolveRecord: unexpected signature ") + arg.currentSignature());

    arg.beginArray();
    while (!arg.atEnd()) {
        BusRecord record;
        ushort klass = 0;
        ushort type = 0;
        arg.beginStructure();
        arg >> record.ifindex >> klass >> type >> record.data;
        arg.endStructure();
        record.klass = klass;
        record.type = type;
        records->append(record);
    }
    arg.endArray();
    return {};
}

static bool decodeTxt(const QVariant& value, QList<QByteArray>* txt)
{
    if (value.canConvert<QDBusArgument>()) {
        const QDBusArgument arg = value.value<QDBusArgument>();
        if (arg.currentSignature() != QLatin1String("aay"))
            return false;
        arg.beginArray();
        while (!arg.atEnd()) {
            QByteArray entry;
            arg >> entry;
            txt->append(entry);
        }
        arg.endArray();
        return true;
    }
    if (value.metaType() == QMetaType::fromType<QByteArrayList>()) {
        *txt = value.value<QByteArrayList>();
        return true;
    }
    return false;
}

BusError ResolvedBus::decodeServiceReply(const QDBusMessage& reply, BusServiceReply* service)
{
    const QList<QVariant> args = reply.arguments();
    if (args.size() < 6 || !args.at(0).canConvert<QDBusArgument>())
        return malformed(QStringLiteral("ResolveService: unexpected reply shape"));

    const QDBusArgument srv = args.at(0).value<QDBusArgument>();
    if (srv.currentSignature() != QLatin1String("a(qqqsa(iiay)s)"))
        return malformed(QStringLiteral("ResolveService: unexpected signature ") + srv.currentSignature());

    srv.beginArray();
    while (!srv.atEnd()) {
        BusSrvEntry entry;
        ushort priority = 0, weight = 0, port = 0;
        srv.beginStructure();
        srv >> priority >> weight >> port >> entry.hostname;
        srv.beginArray();
        while (!srv.atEnd()) {
            BusAddress address;
            srv.beginStructure();
            srv >> address.ifindex >> address.family >> address.address;
            srv.endStructure();
            entry.addresses.append(address);
        }
        srv.endArray();
        srv >> entry.canonicalHostname;
        srv.endStructure();
        entry.priority = priority;
        entry.weight = weight;
        entry.port = port;
        service->srv.append(entry);
    }
    srv.endArray();

    if (!decodeTxt(args.at(1), &service->txt))
        return malformed(QStringLiteral("ResolveService: undecodable TXT data"));

    service->canonicalName = args.at(2).toString();
    service->canonicalType = args.at(3).toString();
    service->canonicalDomain = args.at(4).toString();
    service->flags = args.at(5).toULongLong();
    return {};
}

void ResolvedBus::resolveRecord(int ifindex, const QString& name, uint16_t klass,
                                uint16_t type, uint64_t flags, RecordCallback callback)
{
    QDBusMessage msg = QDBusMessage::createMethodCall(
        kService, kPath, kManagerInterface, QStringLiteral("ResolveRecord"));
    msg << ifindex << name
        << QVariant::fromValue<ushort>(klass)
        << QVariant::fromValue<ushort>(type)
        << QVariant::fromValue<qulonglong>(flags);

    qCDebug(lcResolvedBus) << "[ResolvedBus] ResolveRecord" << name << "type" << type;

    auto* watcher = new QDBusPendingCallWatcher(connection_.asyncCall(msg, timeoutMs_), this);
    connect(watcher, &QDBusPendingCallWatcher::finished, this,
            [watcher, callback = std::move(callback)]() {
        watcher->deleteLater();
        QList<BusRecord> records;
        if (watcher->isError()) {
            const QDBusError err = watcher->error();
            callback(classifyError(err.name(), err.message()), records);
            return;
        }
        BusError error = decodeRecordReply(watcher->reply(), &records);
        if (error.isError())
            records.clear();
        callback(error, records);
    });
}

void ResolvedBus::resolveService(int ifindex, const ServiceInstance& instance, int family,
                                 uint64_t flags, ServiceCallback callback)
{
    QDBusMessage msg = QDBusMessage::createMethodCall(
        kService, kPath, kManagerInterface, QStringLiteral("ResolveService"));
    msg << ifindex << instance.instanceName << instance.serviceType << instance.domain
        << family << QVariant::fromValue<qulonglong>(flags);

    qCDebug(lcResolvedBus) << "[ResolvedBus] ResolveService" << instance.fullName()
                           << "family" << family;

    auto* watcher = new QDBusPendingCallWatcher(connection_.asyncCall(msg, timeoutMs_), this);
    connect(watcher, &QDBusPendingCallWatcher::finished, this,
            [watcher, callback = std::move(callback)]() {
        watcher->deleteLater();
        BusServiceReply service;
        if (watcher->isError()) {
            const QDBusError err = watcher->error();
            callback(classifyError(err.name(), err.message()), service);
            return;
        }
        BusError error = decodeServiceReply(watcher->reply(), &service);
        if (error.isError())
            service = BusServiceReply{};
        callback(error, service);
    });
}

} // namespace rsb
