#include <QtTest>
#include "core/sink/SinkActivator.hpp"
#include "fakes/FakeModuleLoader.hpp"

using rsb::ErrorClass;
using rsb::test::FakeModuleLoader;

class TestSinkActivator : public QObject {
    Q_OBJECT

private:
    static rsb::ResolvedEndpoint kitchen(const QString& address = "192.168.1.20")
    {
        rsb::ResolvedEndpoint ep;
        ep.instance = {"A0B1C2D3E4F5@Kitchen", "_raop._tcp", "local"};
        ep.address = QHostAddress(address);
        ep.port = 7000;
        ep.hostname = "Kitchen.local";
        return ep;
    }

    static rsb::ActivateOutcome activateOnce(rsb::SinkActivator& activator,
                                             const rsb::ResolvedEndpoint& ep)
    {
        bool done = false;
        rsb::ActivateOutcome result;
        activator.activate(ep, [&](const rsb::ActivateOutcome& o) {
            result = o;
            done = true;
        });
        if (!QTest::qWaitFor([&]() { return done; }, 2000))
            qWarning() << "activation timed out";
        return result;
    }

private slots:
    void createsSink()
    {
        FakeModuleLoader loader;
        rsb::SinkActivator activator(&loader, rsb::ActivatorOptions());

        const QDateTime before = QDateTime::currentDateTimeUtc();
        auto outcome = activateOnce(activator, kitchen());

        QVERIFY(outcome.ok());
        QCOMPARE(outcome.module.handle, 100u);
        QCOMPARE(outcome.module.label, QString("Kitchen"));
        QCOMPARE(outcome.module.endpoint, kitchen());
        QVERIFY(outcome.module.createdAt >= before);
        QVERIFY(outcome.module.createdAt.isValid());

        QCOMPARE(loader.moduleNames, QStringList({"libpipewire-module-raop-sink"}));
        QCOMPARE(loader.calls.first().value("raop.ip"), QString("192.168.1.20"));
    }

    void unreachableIsRetryable()
    {
        FakeModuleLoader loader;
        loader.script = {FakeModuleLoader::unreachable()};
        rsb::SinkActivator activator(&loader, rsb::ActivatorOptions());

        auto outcome = activateOnce(activator, kitchen());
        QCOMPARE(outcome.error, ErrorClass::TransientInfrastructure);
        QVERIFY(outcome.retryable);
        QCOMPARE(loader.calls.size(), 1);
    }

    void invalidArgumentsArePermanent()
    {
        FakeModuleLoader loader;
        loader.script = {FakeModuleLoader::invalid()};
        rsb::SinkActivator activator(&loader, rsb::ActivatorOptions());

        auto outcome = activateOnce(activator, kitchen());
        QCOMPARE(outcome.error, ErrorClass::PolicyRejected);
        QVERIFY(!outcome.retryable);
        QVERIFY(!outcome.collision);
    }

    void collisionGetsSuffix()
    {
        FakeModuleLoader loader;
        loader.takenNames = {"Kitchen", "Kitchen (2)"};
        rsb::SinkActivator activator(&loader, rsb::ActivatorOptions());

        auto outcome = activateOnce(activator, kitchen());
        QVERIFY(outcome.ok());
        QCOMPARE(outcome.module.label, QString("Kitchen (3)"));
        QCOMPARE(loader.calls.size(), 3);
        QCOMPARE(loader.calls.at(1).value("raop.name"), QString("Kitchen (2)"));
    }

    void collisionWithoutDisambiguationFails()
    {
        FakeModuleLoader loader;
        loader.takenNames = {"Kitchen"};
        rsb::ActivatorOptions options;
        options.disambiguateLabels = false;
        rsb::SinkActivator activator(&loader, options);

        auto outcome = activateOnce(activator, kitchen());
        QCOMPARE(outcome.error, ErrorClass::PolicyRejected);
        QVERIFY(outcome.collision);
        QVERIFY(!outcome.retryable);
        QCOMPARE(loader.calls.size(), 1);
    }

    void collisionGivesUpAfterMaxSuffix()
    {
        FakeModuleLoader loader;
        loader.takenNames = {"Kitchen", "Kitchen (2)", "Kitchen (3)"};
        rsb::ActivatorOptions options;
        options.maxLabelSuffix = 3;
        rsb::SinkActivator activator(&loader, options);

        auto outcome = activateOnce(activator, kitchen());
        QVERIFY(outcome.collision);
        QCOMPARE(loader.calls.size(), 3);
    }

    void customModuleName()
    {
        FakeModuleLoader loader;
        rsb::ActivatorOptions options;
        options.moduleName = "libpipewire-module-raop-sink-test";
        rsb::SinkActivator activator(&loader, options);

        activateOnce(activator, kitchen());
        QCOMPARE(loader.moduleNames.first(), QString("libpipewire-module-raop-sink-test"));
    }
};

QTEST_MAIN(TestSinkActivator)
#include "test_sink_activator.moc"
