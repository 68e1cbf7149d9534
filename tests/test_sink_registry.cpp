#include <QtTest>
#include "core/reconcile/SinkRegistry.hpp"
#include <thread>
#include <vector>

class TestSinkRegistry : public QObject {
    Q_OBJECT

private:
    static rsb::SinkModule module(const QString& name, const QString& address, uint32_t handle)
    {
        rsb::SinkModule m;
        m.handle = handle;
        m.label = name;
        m.endpoint.instance = {name, "_raop._tcp", "local"};
        m.endpoint.address = QHostAddress(address);
        m.endpoint.port = 7000;
        m.createdAt = QDateTime::currentDateTimeUtc();
        return m;
    }

private slots:
    void keysStartAtOneAndIncrease()
    {
        rsb::SinkRegistry registry;
        QVERIFY(registry.isEmpty());
        QCOMPARE(registry.insert(module("Kitchen", "10.0.0.1", 1)), quint64(1));
        QCOMPARE(registry.insert(module("Den", "10.0.0.2", 2)), quint64(2));
        QCOMPARE(registry.size(), 2);
        const QList<rsb::SinkModule> modules = registry.modules();
        QCOMPARE(modules.size(), 2);
        QCOMPARE(modules.at(0).label, QString("Kitchen"));
        QCOMPARE(modules.at(1).label, QString("Den"));
    }

    void findsByKey()
    {
        rsb::SinkRegistry registry;
        const quint64 key = registry.insert(module("Kitchen", "10.0.0.1", 42));

        rsb::SinkModule found;
        QVERIFY(registry.find(key, &found));
        QCOMPARE(found.handle, 42u);
        QCOMPARE(found.label, QString("Kitchen"));
        QVERIFY(!registry.find(key + 1, &found));
    }

    void tracksAddressesPerIdentity()
    {
        rsb::SinkRegistry registry;
        auto v4 = module("Kitchen", "10.0.0.1", 1);
        auto v6 = module("Kitchen", "2001:db8::1", 2);
        registry.insert(v4);
        registry.insert(v6);

        QVERIFY(registry.containsAddress(v4.endpoint.addressKey()));
        QVERIFY(registry.containsAddress(v6.endpoint.addressKey()));
        QVERIFY(!registry.containsAddress(module("Kitchen", "10.0.0.9", 3).endpoint.addressKey()));
        QCOMPARE(registry.countFor(v4.endpoint.instance), 2);
        QVERIFY(registry.containsLabel("Kitchen"));
        QVERIFY(!registry.containsLabel("Den"));
    }

    void concurrentInsertsGetDistinctKeys()
    {
        rsb::SinkRegistry registry;
        QList<quint64> keys[4];
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&registry, &keys, t]() {
                for (int i = 0; i < 250; ++i)
                    keys[t].append(registry.insert(module(QString("S%1-%2").arg(t).arg(i), "10.0.0.1", 1)));
            });
        }
        for (auto& thread : threads)
            thread.join();

        QSet<quint64> all;
        for (const auto& list : keys) {
            for (quint64 k : list)
                all.insert(k);
        }
        QCOMPARE(all.size(), 1000);
        QCOMPARE(registry.size(), 1000);
        QVERIFY(all.contains(1));
        QVERIFY(all.contains(1000));
    }
};

QTEST_MAIN(TestSinkRegistry)
#include "test_sink_registry.moc"
