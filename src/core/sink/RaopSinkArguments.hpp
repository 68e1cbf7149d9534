#pragma once

#include "core/discovery/ServiceInstance.hpp"
#include <QMap>
#include <QString>

namespace rsb {

/// Values used when the device advertises nothing for a property.
/// Empty strings leave the property to the module's own default.
struct SinkDefaults {
    QString transport = QStringLiteral("udp");
    QString encryption;
    QString codec;
    int latencyMs = 0;
};

/// Builds the property set of libpipewire-module-raop-sink from a resolved
/// endpoint.
class RaopSinkArguments {
public:
    explicit RaopSinkArguments(const SinkDefaults& defaults = SinkDefaults());

    QMap<QString, QString> build(const ResolvedEndpoint& endpoint, const QString& label) const;

    const SinkDefaults& defaults() const { return defaults_; }

    /// "A0B1C2D3E4F5@Kitchen" → "Kitchen". Falls back to the whole name
    /// when nothing follows the '@', and to "<unnamed>" when empty.
    static QString deriveLabel(const QString& instanceName);
    /// "Kitchen" → "Kitchen (2)"
    static QString disambiguatedLabel(const QString& label, int suffix);

    // TXT value → property value, empty when the value is not understood
    static QString transportFor(const QString& tp);
    static QString encryptionFor(const QString& et);
    static QString codecFor(const QString& cn);

private:
    SinkDefaults defaults_;
};

} // namespace rsb
