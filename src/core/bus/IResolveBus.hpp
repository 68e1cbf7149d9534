#pragma once

#include <QByteArray>
#include <QList>
#include <QString>
#include <cstdint>
#include <functional>

namespace rsb {

struct ServiceInstance;

/// Coarse classification of a failed bus call.
enum class BusErrorKind {
    None,
    Unreachable,   ///< resolved not on the bus, bus disconnected
    NotFound,      ///< no such record / service
    Timeout,       ///< query or method call timed out
    Malformed      ///< reply could not be decoded, invalid record data
};

struct BusError {
    BusErrorKind kind = BusErrorKind::None;
    QString name;      // D-Bus error name, if any
    QString message;

    bool isError() const { return kind != BusErrorKind::None; }
    bool isTransient() const
    {
        return kind == BusErrorKind::Unreachable || kind == BusErrorKind::NotFound
            || kind == BusErrorKind::Timeout;
    }
};

/// One entry of ResolveRecord's a(iqqay) reply.
struct BusRecord {
    int ifindex = 0;
    uint16_t klass = 0;
    uint16_t type = 0;
    QByteArray data;   // full RR in wire format
};

/// One (ifindex, family, address) triple of a ResolveService SRV entry.
struct BusAddress {
    int ifindex = 0;
    int family = 0;    // AF_INET / AF_INET6
    QByteArray address;
};

struct BusSrvEntry {
    uint16_t priority = 0;
    uint16_t weight = 0;
    uint16_t port = 0;
    QString hostname;
    QList<BusAddress> addresses;
    QString canonicalHostname;
};

/// Decoded ResolveService reply.
struct BusServiceReply {
    QList<BusSrvEntry> srv;
    QList<QByteArray> txt;
    QString canonicalName;
    QString canonicalType;
    QString canonicalDomain;
    uint64_t flags = 0;
};

/// Narrow request/response client for the name-resolution service.
/// Callbacks are always invoked later from the owning thread's event loop,
/// never synchronously from within the call.
class IResolveBus {
public:
    using RecordCallback = std::function<void(const BusError&, const QList<BusRecord>&)>;
    using ServiceCallback = std::function<void(const BusError&, const BusServiceReply&)>;

    virtual ~IResolveBus() = default;

    virtual bool isConnected() const = 0;

    virtual void resolveRecord(int ifindex, const QString& name, uint16_t klass,
                               uint16_t type, uint64_t flags, RecordCallback callback) = 0;

    virtual void resolveService(int ifindex, const ServiceInstance& instance, int family,
                                uint64_t flags, ServiceCallback callback) = 0;
};

} // namespace rsb
