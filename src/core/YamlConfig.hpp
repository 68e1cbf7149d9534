#pragma once

#include <QString>
#include <yaml-cpp/yaml.h>

namespace rsb {

class YamlConfig {
public:
    YamlConfig();

    /// Deep-merges the file over the built-in defaults. Throws YAML::Exception
    /// when the file cannot be read or parsed.
    void load(const QString& filePath);

    /// ~/.config/raop-sink-bridge/config.yaml
    static QString defaultPath();

    // Discovery
    QString serviceType() const;
    void setServiceType(const QString& v);
    QString domain() const;
    int interfaceIndex() const;
    int pollIntervalMs() const;
    int staleGracePolls() const;
    bool mdnsIPv4() const;
    bool mdnsIPv6() const;

    // Resolver
    QString resolverFamily() const;
    int resolverTimeoutMs() const;
    int resolverMaxAttempts() const;
    int resolverBackoffInitialMs() const;
    double resolverBackoffMultiplier() const;
    int resolverBackoffMaxMs() const;

    // Activator
    QString activatorModule() const;
    int activatorMaxAttempts() const;
    int activatorBackoffInitialMs() const;
    double activatorBackoffMultiplier() const;
    int activatorBackoffMaxMs() const;
    bool disambiguateLabels() const;
    int maxLabelSuffix() const;

    // Sink defaults
    QString sinkTransport() const;
    QString sinkEncryption() const;
    QString sinkCodec() const;
    int sinkLatencyMs() const;

    // Logging
    QString logLevel() const;
    void setLogLevel(const QString& v);

    /// Applies "section.key=value" (e.g. "resolver.backoff.initial_ms=250").
    /// Only existing scalar keys can be set; the value is kept as YAML text
    /// and converted by the typed accessors.
    bool applyOverride(const QString& assignment, QString* error = nullptr);

private:
    YAML::Node root_;

    void initDefaults();
    QString stringAt(const char* section, const char* key, const char* fallback) const;
    int intAt(const char* section, const char* key, int fallback) const;
};

} // namespace rsb
