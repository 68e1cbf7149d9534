#pragma once

#include "core/bus/IResolveBus.hpp"
#include "core/discovery/DnsRecord.hpp"
#include "core/discovery/ServiceInstance.hpp"
#include <QHash>
#include <QHostAddress>
#include <QObject>
#include <QTimer>
#include <QtEndian>
#include <sys/socket.h>

namespace rsb::test {

/// Scripted name-resolution service. Replies are delivered from the event
/// loop after delayMs, like the real bus.
class FakeResolveBus : public IResolveBus {
public:
    struct RecordReply {
        BusError error;
        QList<BusRecord> records;
    };
    struct ServiceReply {
        BusError error;
        BusServiceReply reply;
    };

    bool connected = true;
    int delayMs = 0;

    // Browse replies are consumed in order; the last one repeats
    QList<RecordReply> recordReplies;
    // Per instance key; consumed in order, the last one repeats
    QHash<QString, QList<ServiceReply>> serviceReplies;

    int recordCalls = 0;
    QList<ServiceInstance> serviceCalls;
    QList<int> serviceFamilies;
    QList<int> serviceIfindexes;

    bool isConnected() const override { return connected; }

    void resolveRecord(int /*ifindex*/, const QString& name, uint16_t /*klass*/,
                       uint16_t /*type*/, uint64_t /*flags*/, RecordCallback callback) override
    {
        ++recordCalls;
        lastRecordName = name;
        RecordReply reply;
        if (!recordReplies.isEmpty())
            reply = recordReplies.size() > 1 ? recordReplies.takeFirst() : recordReplies.first();
        else
            reply.error = {BusErrorKind::NotFound, QStringLiteral("org.freedesktop.resolve1.NoSuchResourceRecord"), {}};
        QTimer::singleShot(delayMs, &context_, [callback, reply]() {
            callback(reply.error, reply.records);
        });
    }

    void resolveService(int ifindex, const ServiceInstance& instance, int family,
                        uint64_t /*flags*/, ServiceCallback callback) override
    {
        serviceCalls.append(instance);
        serviceIfindexes.append(ifindex);
        serviceFamilies.append(family);
        ServiceReply reply;
        auto it = serviceReplies.find(instance.key());
        if (it != serviceReplies.end() && !it->isEmpty())
            reply = it->size() > 1 ? it->takeFirst() : it->first();
        else
            reply.error = {BusErrorKind::NotFound, QStringLiteral("org.freedesktop.resolve1.NoSuchService"), {}};
        QTimer::singleShot(delayMs, &context_, [callback, reply]() {
            callback(reply.error, reply.reply);
        });
    }

    int serviceCallsFor(const ServiceInstance& instance) const
    {
        int n = 0;
        for (const auto& i : serviceCalls)
            n += (i == instance) ? 1 : 0;
        return n;
    }

    void setService(const ServiceInstance& instance, const BusServiceReply& reply)
    {
        serviceReplies[instance.key()] = {ServiceReply{BusError{}, reply}};
    }

    void setServiceError(const ServiceInstance& instance, BusErrorKind kind, const QString& name)
    {
        serviceReplies[instance.key()] = {ServiceReply{BusError{kind, name, QStringLiteral("scripted")}, {}}};
    }

    void announce(const QList<ServiceInstance>& instances, int ifindex = 2)
    {
        RecordReply reply;
        for (const auto& instance : instances)
            reply.records.append(ptrRecord(instance, ifindex));
        recordReplies = {reply};
    }

    QString lastRecordName;

    // --- wire format helpers ---

    static QByteArray encodeName(const QStringList& labels)
    {
        QByteArray out;
        for (const auto& label : labels) {
            const QByteArray bytes = label.toUtf8();
            out.append(static_cast<char>(bytes.size()));
            out.append(bytes);
        }
        out.append('\0');
        return out;
    }

    static QByteArray encodeRecord(const QStringList& owner, uint16_t type, uint16_t klass,
                                   uint32_t ttl, const QByteArray& rdata)
    {
        QByteArray out = encodeName(owner);
        uchar fixed[10];
        qToBigEndian<uint16_t>(type, fixed);
        qToBigEndian<uint16_t>(klass, fixed + 2);
        qToBigEndian<uint32_t>(ttl, fixed + 4);
        qToBigEndian<uint16_t>(static_cast<uint16_t>(rdata.size()), fixed + 8);
        out.append(reinterpret_cast<const char*>(fixed), sizeof(fixed));
        out.append(rdata);
        return out;
    }

    static BusRecord ptrRecord(const ServiceInstance& instance, int ifindex = 2)
    {
        QStringList owner = instance.serviceType.split(QLatin1Char('.'));
        owner += instance.domain.split(QLatin1Char('.'));
        QStringList target{instance.instanceName};
        target += owner;

        BusRecord record;
        record.ifindex = ifindex;
        record.klass = dns::kClassIN;
        record.type = dns::kTypePTR;
        record.data = encodeRecord(owner, dns::kTypePTR, dns::kClassIN, 4500, encodeName(target));
        return record;
    }

    static BusAddress address(const QString& text, int ifindex = 2)
    {
        QHostAddress host(text);
        BusAddress addr;
        addr.ifindex = ifindex;
        if (host.protocol() == QAbstractSocket::IPv4Protocol) {
            addr.family = AF_INET;
            uchar raw[4];
            qToBigEndian<quint32>(host.toIPv4Address(), raw);
            addr.address = QByteArray(reinterpret_cast<const char*>(raw), 4);
        } else {
            addr.family = AF_INET6;
            const Q_IPV6ADDR v6 = host.toIPv6Address();
            addr.address = QByteArray(reinterpret_cast<const char*>(v6.c), 16);
        }
        return addr;
    }

    static BusServiceReply service(const QString& hostname, uint16_t port,
                                   const QStringList& addresses,
                                   const QList<QByteArray>& txt = {})
    {
        BusSrvEntry entry;
        entry.port = port;
        entry.hostname = hostname;
        entry.canonicalHostname = hostname;
        for (const auto& a : addresses)
            entry.addresses.append(address(a));

        BusServiceReply reply;
        reply.srv.append(entry);
        reply.txt = txt;
        return reply;
    }

    static ServiceInstance raop(const QString& name)
    {
        return ServiceInstance{name, QStringLiteral("_raop._tcp"), QStringLiteral("local")};
    }

private:
    QObject context_;
};

} // namespace rsb::test
