#pragma once

#include "core/bus/IResolveBus.hpp"
#include <QDBusConnection>
#include <QDBusError>
#include <QDBusMessage>
#include <QObject>

namespace rsb {

/// systemd-resolved flags (resolved-def.h)
constexpr uint64_t kResolvedMdnsIPv4 = uint64_t{1} << 3;
constexpr uint64_t kResolvedMdnsIPv6 = uint64_t{1} << 4;

/// IResolveBus backed by org.freedesktop.resolve1 on the system bus.
///
/// Uses QDBusMessage + asyncCall instead of QDBusInterface so that no
/// blocking introspection round-trip happens on the event loop.
class ResolvedBus : public QObject, public IResolveBus {
    Q_OBJECT
public:
    explicit ResolvedBus(int timeoutMs = 2000, QObject* parent = nullptr);
    ResolvedBus(const QDBusConnection& connection, int timeoutMs, QObject* parent = nullptr);

    bool isConnected() const override;

    void resolveRecord(int ifindex, const QString& name, uint16_t klass,
                       uint16_t type, uint64_t flags, RecordCallback callback) override;

    void resolveService(int ifindex, const ServiceInstance& instance, int family,
                        uint64_t flags, ServiceCallback callback) override;

    /// Map a D-Bus error name onto the bus error taxonomy.
    static BusError classifyError(const QString& errorName, const QString& message);

private:
    static BusError decodeRecordReply(const QDBusMessage& reply, QList<BusRecord>* records);
    static BusError decodeServiceReply(const QDBusMessage& reply, BusServiceReply* service);

    QDBusConnection connection_;
    int timeoutMs_;
};

} // namespace rsb
