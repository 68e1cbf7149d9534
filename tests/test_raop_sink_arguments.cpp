#include <QtTest>
#include "core/sink/RaopSinkArguments.hpp"

using rsb::RaopSinkArguments;

class TestRaopSinkArguments : public QObject {
    Q_OBJECT

private:
    static rsb::ResolvedEndpoint endpoint(const QString& address,
                                          const QMap<QString, QString>& attributes = {})
    {
        rsb::ResolvedEndpoint ep;
        ep.instance = {"A0B1C2D3E4F5@Kitchen", "_raop._tcp", "local"};
        ep.address = QHostAddress(address);
        ep.port = 7000;
        ep.hostname = "Kitchen.local";
        ep.attributes = attributes;
        return ep;
    }

private slots:
    void labelIsFriendlyName()
    {
        QCOMPARE(RaopSinkArguments::deriveLabel("A0B1C2D3E4F5@Kitchen"), QString("Kitchen"));
        QCOMPARE(RaopSinkArguments::deriveLabel("A0B1C2D3E4F5@ Living Room "), QString("Living Room"));
        QCOMPARE(RaopSinkArguments::deriveLabel("A0@B@C"), QString("B@C"));
    }

    void labelFallsBackToWholeName()
    {
        QCOMPARE(RaopSinkArguments::deriveLabel("Office Speaker"), QString("Office Speaker"));
        QCOMPARE(RaopSinkArguments::deriveLabel("A0B1C2D3E4F5@"), QString("A0B1C2D3E4F5@"));
        QCOMPARE(RaopSinkArguments::deriveLabel("  "), QString("<unnamed>"));
        QCOMPARE(RaopSinkArguments::deriveLabel(QString()), QString("<unnamed>"));
    }

    void labelIsDeterministic()
    {
        const QString name = "5C:AA:FD:00:11:22@Bedroom";
        QCOMPARE(RaopSinkArguments::deriveLabel(name), RaopSinkArguments::deriveLabel(name));
    }

    void disambiguates()
    {
        QCOMPARE(RaopSinkArguments::disambiguatedLabel("Kitchen", 2), QString("Kitchen (2)"));
    }

    void basicProperties()
    {
        RaopSinkArguments args;
        auto props = args.build(endpoint("192.168.1.20"), "Kitchen");

        QCOMPARE(props.value("raop.ip"), QString("192.168.1.20"));
        QCOMPARE(props.value("raop.ip.version"), QString("4"));
        QCOMPARE(props.value("raop.port"), QString("7000"));
        QCOMPARE(props.value("raop.name"), QString("Kitchen"));
        QCOMPARE(props.value("raop.hostname"), QString("Kitchen.local"));
        // default transport applies without tp
        QCOMPARE(props.value("raop.transport"), QString("udp"));
        QVERIFY(!props.contains("raop.encryption.type"));
        QVERIFY(!props.contains("raop.audio.codec"));
        QVERIFY(!props.contains("raop.latency.ms"));
    }

    void ipv6Version()
    {
        RaopSinkArguments args;
        auto props = args.build(endpoint("2001:db8::20"), "Kitchen");
        QCOMPARE(props.value("raop.ip.version"), QString("6"));
        QCOMPARE(props.value("raop.ip"), QString("2001:db8::20"));
    }

    void transportFromTxt()
    {
        QCOMPARE(RaopSinkArguments::transportFor("TCP,UDP"), QString("udp"));
        QCOMPARE(RaopSinkArguments::transportFor("TCP"), QString("tcp"));
        QVERIFY(RaopSinkArguments::transportFor("QUIC").isEmpty());

        rsb::SinkDefaults defaults;
        defaults.transport = "tcp";
        RaopSinkArguments args(defaults);
        QCOMPARE(args.build(endpoint("10.0.0.1", {{"tp", "UDP"}}), "K").value("raop.transport"), QString("udp"));
        QCOMPARE(args.build(endpoint("10.0.0.1", {{"tp", "QUIC"}}), "K").value("raop.transport"), QString("tcp"));
    }

    void encryptionFromTxt()
    {
        QCOMPARE(RaopSinkArguments::encryptionFor("0,1,3"), QString("RSA"));
        QCOMPARE(RaopSinkArguments::encryptionFor("0,4"), QString("auth_setup"));
        QVERIFY(RaopSinkArguments::encryptionFor("0,3,5").isEmpty());

        RaopSinkArguments args;
        auto props = args.build(endpoint("10.0.0.1", {{"et", "0,3,5"}}), "K");
        QCOMPARE(props.value("raop.encryption.type"), QString("none"));
    }

    void codecPicksBest()
    {
        QCOMPARE(RaopSinkArguments::codecFor("0,1,2,3"), QString("AAC-ELD"));
        QCOMPARE(RaopSinkArguments::codecFor("0,1,2"), QString("AAC"));
        QCOMPARE(RaopSinkArguments::codecFor("0,1"), QString("ALAC"));
        QCOMPARE(RaopSinkArguments::codecFor("0"), QString("PCM"));
        QVERIFY(RaopSinkArguments::codecFor("7").isEmpty());

        rsb::SinkDefaults defaults;
        defaults.codec = "PCM";
        RaopSinkArguments args(defaults);
        // unknown codec skips the property rather than falling back
        QVERIFY(!args.build(endpoint("10.0.0.1", {{"cn", "7"}}), "K").contains("raop.audio.codec"));
        QCOMPARE(args.build(endpoint("10.0.0.1"), "K").value("raop.audio.codec"), QString("PCM"));
    }

    void modelAndLatency()
    {
        rsb::SinkDefaults defaults;
        defaults.latencyMs = 1800;
        RaopSinkArguments args(defaults);
        auto props = args.build(endpoint("10.0.0.1", {{"am", "AudioAccessory5,1"}}), "K");
        QCOMPARE(props.value("device.model"), QString("AudioAccessory5,1"));
        QCOMPARE(props.value("raop.latency.ms"), QString("1800"));
    }

    void emptyDefaultTransportLeavesModuleDefault()
    {
        rsb::SinkDefaults defaults;
        defaults.transport.clear();
        RaopSinkArguments args(defaults);
        QVERIFY(!args.build(endpoint("10.0.0.1"), "K").contains("raop.transport"));
    }
};

QTEST_MAIN(TestRaopSinkArguments)
#include "test_raop_sink_arguments.moc"
