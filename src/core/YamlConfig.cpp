#include "core/YamlConfig.hpp"
#include <QDir>
#include <QStringList>
#include <vector>

namespace rsb {

namespace {

// Deep merge: overlay values override base values.
// Mappings recurse, sequences and scalars override entirely,
// missing keys in overlay preserve base defaults.
YAML::Node mergeYaml(const YAML::Node& base, const YAML::Node& overlay)
{
    if (!overlay.IsDefined() || overlay.IsNull())
        return YAML::Clone(base);

    if (!base.IsDefined() || base.IsNull())
        return YAML::Clone(overlay);

    if (base.IsMap() && overlay.IsMap()) {
        YAML::Node result = YAML::Clone(base);
        for (auto it = overlay.begin(); it != overlay.end(); ++it) {
            const auto key = it->first.as<std::string>();
            if (result[key])
                result[key] = mergeYaml(result[key], it->second);
            else
                result[key] = YAML::Clone(it->second);
        }
        return result;
    }

    return YAML::Clone(overlay);
}

} // namespace

YamlConfig::YamlConfig()
{
    initDefaults();
}

void YamlConfig::initDefaults()
{
    root_ = YAML::Node(YAML::NodeType::Map);

    root_["discovery"]["service_type"] = "_raop._tcp";
    root_["discovery"]["domain"] = "local";
    root_["discovery"]["interface_index"] = 0;
    root_["discovery"]["poll_interval_ms"] = 3000;
    root_["discovery"]["stale_grace_polls"] = 8;
    root_["discovery"]["mdns_ipv4"] = true;
    root_["discovery"]["mdns_ipv6"] = true;

    root_["resolver"]["family"] = "any";
    root_["resolver"]["timeout_ms"] = 2000;
    root_["resolver"]["max_attempts"] = 4;
    root_["resolver"]["backoff"]["initial_ms"] = 500;
    root_["resolver"]["backoff"]["multiplier"] = 2.0;
    root_["resolver"]["backoff"]["max_ms"] = 8000;

    root_["activator"]["module"] = "libpipewire-module-raop-sink";
    root_["activator"]["max_attempts"] = 3;
    root_["activator"]["backoff"]["initial_ms"] = 1000;
    root_["activator"]["backoff"]["multiplier"] = 2.0;
    root_["activator"]["backoff"]["max_ms"] = 10000;
    root_["activator"]["disambiguate_labels"] = true;
    root_["activator"]["max_label_suffix"] = 9;

    root_["sink"]["transport"] = "udp";
    root_["sink"]["encryption"] = "";
    root_["sink"]["codec"] = "";
    root_["sink"]["latency_ms"] = 0;

    root_["logging"]["level"] = "info";
}

void YamlConfig::load(const QString& filePath)
{
    initDefaults();
    YAML::Node defaults = YAML::Clone(root_);

    YAML::Node loaded = YAML::LoadFile(filePath.toStdString());
    root_ = mergeYaml(defaults, loaded);
}

QString YamlConfig::defaultPath()
{
    return QDir::homePath() + QStringLiteral("/.config/raop-sink-bridge/config.yaml");
}

QString YamlConfig::stringAt(const char* section, const char* key, const char* fallback) const
{
    return QString::fromStdString(root_[section][key].as<std::string>(fallback));
}

int YamlConfig::intAt(const char* section, const char* key, int fallback) const
{
    return root_[section][key].as<int>(fallback);
}

// --- Discovery ---

QString YamlConfig::serviceType() const
{
    return stringAt("discovery", "service_type", "_raop._tcp");
}

void YamlConfig::setServiceType(const QString& v)
{
    root_["discovery"]["service_type"] = v.toStdString();
}

QString YamlConfig::domain() const
{
    return stringAt("discovery", "domain", "local");
}

int YamlConfig::interfaceIndex() const
{
    return intAt("discovery", "interface_index", 0);
}

int YamlConfig::pollIntervalMs() const
{
    return intAt("discovery", "poll_interval_ms", 3000);
}

int YamlConfig::staleGracePolls() const
{
    return intAt("discovery", "stale_grace_polls", 8);
}

bool YamlConfig::mdnsIPv4() const
{
    return root_["discovery"]["mdns_ipv4"].as<bool>(true);
}

bool YamlConfig::mdnsIPv6() const
{
    return root_["discovery"]["mdns_ipv6"].as<bool>(true);
}

// --- Resolver ---

QString YamlConfig::resolverFamily() const
{
    return stringAt("resolver", "family", "any");
}

int YamlConfig::resolverTimeoutMs() const
{
    return intAt("resolver", "timeout_ms", 2000);
}

int YamlConfig::resolverMaxAttempts() const
{
    return intAt("resolver", "max_attempts", 4);
}

int YamlConfig::resolverBackoffInitialMs() const
{
    return root_["resolver"]["backoff"]["initial_ms"].as<int>(500);
}

double YamlConfig::resolverBackoffMultiplier() const
{
    return root_["resolver"]["backoff"]["multiplier"].as<double>(2.0);
}

int YamlConfig::resolverBackoffMaxMs() const
{
    return root_["resolver"]["backoff"]["max_ms"].as<int>(8000);
}

// --- Activator ---

QString YamlConfig::activatorModule() const
{
    return stringAt("activator", "module", "libpipewire-module-raop-sink");
}

int YamlConfig::activatorMaxAttempts() const
{
    return intAt("activator", "max_attempts", 3);
}

int YamlConfig::activatorBackoffInitialMs() const
{
    return root_["activator"]["backoff"]["initial_ms"].as<int>(1000);
}

double YamlConfig::activatorBackoffMultiplier() const
{
    return root_["activator"]["backoff"]["multiplier"].as<double>(2.0);
}

int YamlConfig::activatorBackoffMaxMs() const
{
    return root_["activator"]["backoff"]["max_ms"].as<int>(10000);
}

bool YamlConfig::disambiguateLabels() const
{
    return root_["activator"]["disambiguate_labels"].as<bool>(true);
}

int YamlConfig::maxLabelSuffix() const
{
    return intAt("activator", "max_label_suffix", 9);
}

// --- Sink defaults ---

QString YamlConfig::sinkTransport() const
{
    return stringAt("sink", "transport", "udp");
}

QString YamlConfig::sinkEncryption() const
{
    return stringAt("sink", "encryption", "");
}

QString YamlConfig::sinkCodec() const
{
    return stringAt("sink", "codec", "");
}

int YamlConfig::sinkLatencyMs() const
{
    return intAt("sink", "latency_ms", 0);
}

// --- Logging ---

QString YamlConfig::logLevel() const
{
    return stringAt("logging", "level", "info");
}

void YamlConfig::setLogLevel(const QString& v)
{
    root_["logging"]["level"] = v.toStdString();
}

// --- Command-line overrides ---

bool YamlConfig::applyOverride(const QString& assignment, QString* error)
{
    auto fail = [error](const QString& why) {
        if (error) *error = why;
        return false;
    };

    const int eq = assignment.indexOf(QLatin1Char('='));
    if (eq <= 0)
        return fail(QStringLiteral("expected section.key=value"));

    const QString path = assignment.left(eq).trimmed();
    const QStringList parts = path.split(QLatin1Char('.'));

    // Walk through the const overload so lookups never insert keys
    std::vector<YAML::Node> chain{root_};
    for (const auto& part : parts) {
        const YAML::Node& parent = chain.back();
        if (part.isEmpty() || !parent.IsMap())
            return fail(QStringLiteral("unknown key '%1'").arg(path));
        YAML::Node child = parent[part.toStdString()];
        if (!child.IsDefined())
            return fail(QStringLiteral("unknown key '%1'").arg(path));
        chain.push_back(child);
    }
    if (!chain.back().IsScalar())
        return fail(QStringLiteral("'%1' is a section, not a value").arg(path));

    chain.back() = assignment.mid(eq + 1).trimmed().toStdString();
    return true;
}

} // namespace rsb
