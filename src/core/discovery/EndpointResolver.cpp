#include "core/discovery/EndpointResolver.hpp"
#include <QLoggingCategory>
#include <QMetaObject>
#include <QRegularExpression>
#include <QtEndian>
#include <algorithm>
#include <sys/socket.h>

Q_LOGGING_CATEGORY(lcResolver, "rsb.discovery.resolver")

namespace rsb {

EndpointResolver::EndpointResolver(IResolveBus* bus, const ResolverOptions& options, QObject* parent)
    : QObject(parent)
    , bus_(bus)
    , options_(options)
{
}

int EndpointResolver::familyToAf(AddressFamilyPolicy family)
{
    switch (family) {
    case AddressFamilyPolicy::IPv4Only: return AF_INET;
    case AddressFamilyPolicy::IPv6Only: return AF_INET6;
    case AddressFamilyPolicy::Any:
    default:                            return AF_UNSPEC;
    }
}

bool EndpointResolver::isValidInstance(const ServiceInstance& instance, QString* reason)
{
    static const QRegularExpression typePattern(
        QStringLiteral("^_[A-Za-z0-9](?:[A-Za-z0-9-]{0,14})\\._(?:tcp|udp)$"));

    auto fail = [reason](const QString& why) {
        if (reason) *reason = why;
        return false;
    };

    const QByteArray name = instance.instanceName.toUtf8();
    if (name.isEmpty())
        return fail(QStringLiteral("empty instance name"));
    if (name.size() > 63)
        return fail(QStringLiteral("instance name longer than 63 bytes"));
    if (!typePattern.match(instance.serviceType).hasMatch())
        return fail(QStringLiteral("invalid service type '%1'").arg(instance.serviceType));
    if (instance.domain.isEmpty())
        return fail(QStringLiteral("empty domain"));
    const QStringList domainLabels = instance.domain.split(QLatin1Char('.'));
    for (const auto& label : domainLabels) {
        if (label.isEmpty() || label.toUtf8().size() > 63)
            return fail(QStringLiteral("invalid domain '%1'").arg(instance.domain));
    }
    return true;
}

QMap<QString, QString> EndpointResolver::parseAttributes(const QList<QByteArray>& txt)
{
    // RFC 6763 6.4: keys are case-insensitive, only the first occurrence counts
    QMap<QString, QString> attributes;
    for (const auto& entry : txt) {
        if (entry.isEmpty())
            continue;
        const int eq = entry.indexOf('=');
        const QByteArray rawKey = eq < 0 ? entry : entry.left(eq);
        if (rawKey.isEmpty())
            continue;
        const QString key = QString::fromUtf8(rawKey).toLower();
        if (attributes.contains(key))
            continue;
        attributes.insert(key, eq < 0 ? QString() : QString::fromUtf8(entry.mid(eq + 1)));
    }
    return attributes;
}

ResolveOutcome EndpointResolver::buildEndpoint(const ServiceInstance& instance,
                                               const BusServiceReply& reply,
                                               AddressFamilyPolicy family)
{
    ResolveOutcome outcome;

    if (reply.srv.isEmpty()) {
        outcome.error = ErrorClass::MalformedInput;
        outcome.message = QStringLiteral("reply carries no SRV data");
        return outcome;
    }

    QList<BusSrvEntry> srv = reply.srv;
    std::stable_sort(srv.begin(), srv.end(), [](const BusSrvEntry& a, const BusSrvEntry& b) {
        return a.priority < b.priority;
    });

    struct Candidate {
        QHostAddress address;
        const BusSrvEntry* entry;
    };
    QList<Candidate> ipv4;
    QList<Candidate> ipv6;
    int linkLocalV6 = 0;
    int malformed = 0;

    for (const auto& entry : srv) {
        if (entry.port == 0) {
            ++malformed;
            continue;
        }
        for (const auto& addr : entry.addresses) {
            if (addr.family == AF_INET && addr.address.size() == 4) {
                if (family == AddressFamilyPolicy::IPv6Only)
                    continue;
                const quint32 v4 = qFromBigEndian<quint32>(
                    reinterpret_cast<const uchar*>(addr.address.constData()));
                ipv4.append({QHostAddress(v4), &entry});
            } else if (addr.family == AF_INET6 && addr.address.size() == 16) {
                if (family == AddressFamilyPolicy::IPv4Only)
                    continue;
                QHostAddress v6(reinterpret_cast<const quint8*>(addr.address.constData()));
                if (v6.isLinkLocal()) {
                    // The RAOP sink has no way to pin a link-local peer to an interface
                    ++linkLocalV6;
                    continue;
                }
                ipv6.append({v6, &entry});
            } else {
                ++malformed;
            }
        }
    }

    const Candidate* chosen = nullptr;
    if (!ipv4.isEmpty())
        chosen = &ipv4.constFirst();
    else if (!ipv6.isEmpty())
        chosen = &ipv6.constFirst();

    if (!chosen) {
        if (linkLocalV6 > 0) {
            outcome.error = ErrorClass::PolicyRejected;
            outcome.message = QStringLiteral("resolution unsupported: only IPv6 link-local addresses");
        } else {
            outcome.error = ErrorClass::MalformedInput;
            outcome.message = malformed > 0
                ? QStringLiteral("no valid address (%1 malformed entries)").arg(malformed)
                : QStringLiteral("no address in reply");
        }
        return outcome;
    }

    ResolvedEndpoint& ep = outcome.endpoint;
    ep.instance = instance;
    ep.address = chosen->address;
    ep.port = chosen->entry->port;
    ep.hostname = chosen->entry->hostname;
    ep.attributes = parseAttributes(reply.txt);
    return outcome;
}

void EndpointResolver::resolve(const ServiceInstance& instance, int ifindex, Callback callback)
{
    QString reason;
    if (!isValidInstance(instance, &reason)) {
        ResolveOutcome outcome;
        outcome.error = ErrorClass::MalformedInput;
        outcome.message = reason;
        QMetaObject::invokeMethod(this, [callback, outcome]() {
            callback(outcome);
        }, Qt::QueuedConnection);
        return;
    }

    const AddressFamilyPolicy family = options_.family;
    bus_->resolveService(ifindex, instance, familyToAf(family), options_.flags,
                         [instance, family, callback](const BusError& error,
                                                               const BusServiceReply& reply) {
        if (error.isError()) {
            ResolveOutcome outcome;
            outcome.message = error.name.isEmpty()
                ? error.message
                : error.name + QStringLiteral(": ") + error.message;
            if (error.isTransient()) {
                outcome.error = ErrorClass::TransientInfrastructure;
                outcome.retryable = true;
            } else {
                outcome.error = ErrorClass::MalformedInput;
            }
            callback(outcome);
            return;
        }

        ResolveOutcome outcome = buildEndpoint(instance, reply, family);
        if (outcome.ok()) {
            qCDebug(lcResolver) << "[Resolver]" << instance.fullName() << "→"
                                << outcome.endpoint.address.toString() << outcome.endpoint.port
                                << "attributes" << outcome.endpoint.attributes.keys();
        }
        callback(outcome);
    });
}

} // namespace rsb
