#include <QtTest>
#include "core/bus/ResolvedBus.hpp"
#include "core/discovery/DnsRecord.hpp"
#include "core/discovery/ServiceInstance.hpp"

using rsb::BusErrorKind;
using rsb::ResolvedBus;

class TestResolvedBus : public QObject {
    Q_OBJECT

private slots:
    void classifiesMissingServiceAsUnreachable()
    {
        auto e = ResolvedBus::classifyError("org.freedesktop.DBus.Error.ServiceUnknown", "gone");
        QCOMPARE(e.kind, BusErrorKind::Unreachable);
        QVERIFY(e.isTransient());
        QCOMPARE(e.message, QString("gone"));

        QCOMPARE(ResolvedBus::classifyError("org.freedesktop.DBus.Error.NameHasNoOwner", {}).kind,
                 BusErrorKind::Unreachable);
        QCOMPARE(ResolvedBus::classifyError("org.freedesktop.DBus.Error.Disconnected", {}).kind,
                 BusErrorKind::Unreachable);
    }

    void classifiesTimeouts()
    {
        QCOMPARE(ResolvedBus::classifyError("org.freedesktop.DBus.Error.NoReply", {}).kind,
                 BusErrorKind::Timeout);
        QCOMPARE(ResolvedBus::classifyError("org.freedesktop.DBus.Error.Timeout", {}).kind,
                 BusErrorKind::Timeout);
    }

    void classifiesMissingRecordsAsNotFound()
    {
        QCOMPARE(ResolvedBus::classifyError("org.freedesktop.resolve1.NoSuchResourceRecord", {}).kind,
                 BusErrorKind::NotFound);
        QCOMPARE(ResolvedBus::classifyError("org.freedesktop.resolve1.NoSuchService", {}).kind,
                 BusErrorKind::NotFound);
        QCOMPARE(ResolvedBus::classifyError("org.freedesktop.resolve1.DnsError.SERVFAIL", {}).kind,
                 BusErrorKind::NotFound);
    }

    void classifiesBadDataAsMalformed()
    {
        auto e = ResolvedBus::classifyError("org.freedesktop.resolve1.DnsError.FORMERR", {});
        QCOMPARE(e.kind, BusErrorKind::Malformed);
        QVERIFY(!e.isTransient());
        QCOMPARE(ResolvedBus::classifyError("org.freedesktop.DBus.Error.InvalidArgs", {}).kind,
                 BusErrorKind::Malformed);
        QCOMPARE(ResolvedBus::classifyError("com.example.Whatever", {}).kind,
                 BusErrorKind::Malformed);
    }

    void disconnectedBusReportsUnreachableLater()
    {
        ResolvedBus bus(QDBusConnection(QStringLiteral("rsb-test-no-such-connection")), 500);
        QVERIFY(!bus.isConnected());

        bool called = false;
        rsb::BusError error;
        bus.resolveRecord(0, "_raop._tcp.local", rsb::dns::kClassIN, rsb::dns::kTypePTR,
                          rsb::kResolvedMdnsIPv4,
                          [&](const rsb::BusError& e, const QList<rsb::BusRecord>& records) {
            called = true;
            error = e;
            QVERIFY(records.isEmpty());
        });

        // never synchronous
        QVERIFY(!called);
        QTRY_VERIFY(called);
        QCOMPARE(error.kind, BusErrorKind::Unreachable);
    }

    void disconnectedBusFailsServiceResolution()
    {
        ResolvedBus bus(QDBusConnection(QStringLiteral("rsb-test-no-such-connection")), 500);

        bool called = false;
        rsb::BusError error;
        rsb::ServiceInstance instance{"A0B1C2D3E4F5@Kitchen", "_raop._tcp", "local"};
        bus.resolveService(0, instance, 0, 0,
                           [&](const rsb::BusError& e, const rsb::BusServiceReply& reply) {
            called = true;
            error = e;
            QVERIFY(reply.srv.isEmpty());
        });

        QTRY_VERIFY(called);
        QVERIFY(error.isTransient());
    }
};

QTEST_MAIN(TestResolvedBus)
#include "test_resolved_bus.moc"
