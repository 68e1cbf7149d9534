#include <signal.h>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDBusConnection>
#include <QFile>
#include <QLoggingCategory>
#include "core/Logging.hpp"
#include "core/YamlConfig.hpp"
#include "core/bus/ResolvedBus.hpp"
#include "core/discovery/EndpointResolver.hpp"
#include "core/discovery/ServiceBrowser.hpp"
#include "core/reconcile/DiscoveryReconciler.hpp"
#include "core/sink/PipeWireModuleLoader.hpp"
#include "core/sink/SinkActivator.hpp"

Q_LOGGING_CATEGORY(lcMain, "rsb.main")

namespace {

rsb::DiscoveryReconciler* g_reconciler = nullptr;

void requestShutdown(int)
{
    QMetaObject::invokeMethod(g_reconciler, []() { g_reconciler->shutdown(); },
                              Qt::QueuedConnection);
}

rsb::AddressFamilyPolicy familyFromConfig(const QString& family)
{
    const QString f = family.trimmed().toLower();
    if (f == QLatin1String("ipv4"))
        return rsb::AddressFamilyPolicy::IPv4Only;
    if (f == QLatin1String("ipv6"))
        return rsb::AddressFamilyPolicy::IPv6Only;
    if (f != QLatin1String("any"))
        qCWarning(lcMain) << "[Main] Unknown resolver.family" << family << "- using any";
    return rsb::AddressFamilyPolicy::Any;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("raop-sink-bridge");
    app.setApplicationVersion("0.1.0");

    qRegisterMetaType<rsb::ServiceInstance>();
    qRegisterMetaType<rsb::SinkModule>();
    qRegisterMetaType<rsb::TaskState>();
    qRegisterMetaType<rsb::ErrorClass>();

    QCommandLineParser parser;
    parser.setApplicationDescription("Creates PipeWire RAOP sinks for AirPlay receivers found over mDNS");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption({"c", "config"}, "Configuration file.", "file");
    QCommandLineOption serviceTypeOption("service-type", "Service type to browse (default _raop._tcp).", "type");
    QCommandLineOption verboseOption({"v", "verbose"}, "Enable debug logging.");
    QCommandLineOption setOption("set", "Override a configuration value, e.g. resolver.family=ipv4 (repeatable).",
                                 "key=value");
    parser.addOption(configOption);
    parser.addOption(serviceTypeOption);
    parser.addOption(verboseOption);
    parser.addOption(setOption);
    parser.process(app);

    rsb::initLogging(rsb::LogLevel::Info);

    // Explicit --config must exist; the default path is optional
    rsb::YamlConfig config;
    const bool explicitConfig = parser.isSet(configOption);
    const QString configPath = explicitConfig ? parser.value(configOption) : rsb::YamlConfig::defaultPath();
    if (explicitConfig || QFile::exists(configPath)) {
        try {
            config.load(configPath);
            qCInfo(lcMain) << "[Main] Loaded config" << configPath;
        } catch (const YAML::Exception& e) {
            qCCritical(lcMain) << "[Main] Cannot load config" << configPath << ":" << e.what();
            return 1;
        }
    }

    for (const QString& assignment : parser.values(setOption)) {
        QString error;
        if (!config.applyOverride(assignment, &error)) {
            qCCritical(lcMain) << "[Main] Invalid --set" << assignment << ":" << error;
            return 1;
        }
    }

    if (parser.isSet(serviceTypeOption))
        config.setServiceType(parser.value(serviceTypeOption));
    if (parser.isSet(verboseOption))
        config.setLogLevel(QStringLiteral("debug"));

    rsb::LogLevel level = rsb::LogLevel::Info;
    if (!rsb::parseLogLevel(config.logLevel(), &level))
        qCWarning(lcMain) << "[Main] Unknown logging.level" << config.logLevel() << "- using info";
    rsb::initLogging(level);

    // --- Name resolution ---
    auto* bus = new rsb::ResolvedBus(config.resolverTimeoutMs(), &app);
    if (!bus->isConnected()) {
        qCCritical(lcMain) << "[Main] System bus unavailable:"
                           << QDBusConnection::systemBus().lastError().message();
        return 1;
    }

    uint64_t mdnsFlags = 0;
    if (config.mdnsIPv4())
        mdnsFlags |= rsb::kResolvedMdnsIPv4;
    if (config.mdnsIPv6())
        mdnsFlags |= rsb::kResolvedMdnsIPv6;

    rsb::BrowseOptions browseOptions;
    browseOptions.serviceType = config.serviceType();
    browseOptions.domain = config.domain();
    browseOptions.ifindex = config.interfaceIndex();
    browseOptions.flags = mdnsFlags;
    browseOptions.pollIntervalMs = config.pollIntervalMs();
    browseOptions.staleGracePolls = config.staleGracePolls();
    auto* browser = new rsb::ServiceBrowser(bus, browseOptions, &app);

    rsb::ResolverOptions resolverOptions;
    resolverOptions.family = familyFromConfig(config.resolverFamily());
    resolverOptions.flags = mdnsFlags;
    auto* resolver = new rsb::EndpointResolver(bus, resolverOptions, &app);

    // --- Media server ---
    auto* loader = new rsb::PipeWireModuleLoader(&app);
    if (!loader->isAvailable())
        qCWarning(lcMain) << "[Main] PipeWire unavailable, sinks cannot be created";

    rsb::ActivatorOptions activatorOptions;
    activatorOptions.moduleName = config.activatorModule();
    activatorOptions.disambiguateLabels = config.disambiguateLabels();
    activatorOptions.maxLabelSuffix = config.maxLabelSuffix();

    rsb::SinkDefaults sinkDefaults;
    sinkDefaults.transport = config.sinkTransport();
    sinkDefaults.encryption = config.sinkEncryption();
    sinkDefaults.codec = config.sinkCodec();
    sinkDefaults.latencyMs = config.sinkLatencyMs();
    auto* activator = new rsb::SinkActivator(loader, activatorOptions, sinkDefaults, &app);

    // --- Reconciliation ---
    rsb::ReconcilerOptions reconcilerOptions;
    reconcilerOptions.resolveRetry.maxAttempts = config.resolverMaxAttempts();
    reconcilerOptions.resolveRetry.initialDelayMs = config.resolverBackoffInitialMs();
    reconcilerOptions.resolveRetry.multiplier = config.resolverBackoffMultiplier();
    reconcilerOptions.resolveRetry.maxDelayMs = config.resolverBackoffMaxMs();
    reconcilerOptions.activateRetry.maxAttempts = config.activatorMaxAttempts();
    reconcilerOptions.activateRetry.initialDelayMs = config.activatorBackoffInitialMs();
    reconcilerOptions.activateRetry.multiplier = config.activatorBackoffMultiplier();
    reconcilerOptions.activateRetry.maxDelayMs = config.activatorBackoffMaxMs();

    auto* reconciler = new rsb::DiscoveryReconciler(browser, resolver, activator,
                                                    reconcilerOptions, &app);

    QObject::connect(reconciler, &rsb::DiscoveryReconciler::startFailed,
                     &app, [&app](const QString&) { app.exit(1); });
    QObject::connect(reconciler, &rsb::DiscoveryReconciler::drained, &app, [&app, reconciler]() {
        const QList<rsb::SinkModule> sinks = reconciler->registry().modules();
        qCInfo(lcMain) << "[Main] Exiting," << sinks.size() << "sinks were created";
        for (const auto& sink : sinks) {
            qCInfo(lcMain).noquote() << "[Main]  " << sink.label << "module" << sink.handle
                                     << sink.endpoint.address.toString() + QLatin1Char(':')
                                            + QString::number(sink.endpoint.port);
        }
        app.quit();
    });

    // SIGINT/SIGTERM → stop browsing, let in-flight work settle, then quit
    g_reconciler = reconciler;
    signal(SIGINT, requestShutdown);
    signal(SIGTERM, requestShutdown);

    reconciler->start();

    return app.exec();
}
