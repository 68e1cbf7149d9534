#pragma once

#include <QDateTime>
#include <QHash>
#include <QHostAddress>
#include <QMap>
#include <QMetaType>
#include <QString>
#include <QStringList>
#include <cstdint>

namespace rsb {

/// One advertised device record: identity is (instance name, type, domain).
struct ServiceInstance {
    QString instanceName;   // e.g. "A0B1C2D3E4F5@Kitchen"
    QString serviceType;    // e.g. "_raop._tcp"
    QString domain;         // e.g. "local"

    /// Identity key, case-insensitive as DNS names are.
    QString key() const
    {
        return QStringList{instanceName.toLower(), serviceType.toLower(), domain.toLower()}
            .join(QChar(0x1f));
    }

    /// Dotted service name as used in resolved queries.
    QString fullName() const
    {
        return instanceName + QLatin1Char('.') + serviceType + QLatin1Char('.') + domain;
    }

    bool operator==(const ServiceInstance& other) const { return key() == other.key(); }
    bool operator!=(const ServiceInstance& other) const { return !(*this == other); }
};

inline size_t qHash(const ServiceInstance& instance, size_t seed = 0)
{
    return qHash(instance.key(), seed);
}

/// Outcome of resolving a ServiceInstance. Immutable once built.
struct ResolvedEndpoint {
    ServiceInstance instance;
    QHostAddress address;
    uint16_t port = 0;
    QString hostname;
    QMap<QString, QString> attributes;  // TXT keys (lower-cased) → values

    bool isIPv4() const { return address.protocol() == QAbstractSocket::IPv4Protocol; }

    /// (identity, address, port); the dedup key of the reconciler.
    QString addressKey() const
    {
        return instance.key() + QChar(0x1f) + address.toString()
            + QChar(0x1f) + QString::number(port);
    }

    QString attribute(const QString& key, const QString& fallback = {}) const
    {
        return attributes.value(key.toLower(), fallback);
    }

    bool operator==(const ResolvedEndpoint& other) const
    {
        return instance == other.instance && address == other.address
            && port == other.port && hostname == other.hostname
            && attributes == other.attributes;
    }
};

/// A live sink in the media server.
struct SinkModule {
    uint32_t handle = 0;   // PipeWire module global id
    QString label;
    ResolvedEndpoint endpoint;
    QDateTime createdAt;
};

/// Error taxonomy shared by the resolver, the activator and the reconciler.
enum class ErrorClass {
    None,
    TransientInfrastructure,
    MalformedInput,
    PolicyRejected,
    FatalStartup
};

inline const char* errorClassName(ErrorClass c)
{
    switch (c) {
    case ErrorClass::None:                    return "none";
    case ErrorClass::TransientInfrastructure: return "transient";
    case ErrorClass::MalformedInput:          return "malformed";
    case ErrorClass::PolicyRejected:          return "policy-rejected";
    case ErrorClass::FatalStartup:            return "fatal-startup";
    }
    return "unknown";
}

} // namespace rsb

Q_DECLARE_METATYPE(rsb::ServiceInstance)
Q_DECLARE_METATYPE(rsb::ResolvedEndpoint)
Q_DECLARE_METATYPE(rsb::SinkModule)
Q_DECLARE_METATYPE(rsb::ErrorClass)
