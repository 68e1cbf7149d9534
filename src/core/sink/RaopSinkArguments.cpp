#include "core/sink/RaopSinkArguments.hpp"
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(lcSinkArgs, "rsb.sink.arguments")

namespace rsb {

namespace {

// Comma-separated TXT list contains value
bool listContains(const QString& list, const QString& value)
{
    const QStringList items = list.split(QLatin1Char(','));
    for (const auto& item : items) {
        if (item.trimmed().compare(value, Qt::CaseInsensitive) == 0)
            return true;
    }
    return false;
}

} // namespace

RaopSinkArguments::RaopSinkArguments(const SinkDefaults& defaults)
    : defaults_(defaults)
{
}

QString RaopSinkArguments::deriveLabel(const QString& instanceName)
{
    QString label = instanceName;
    const int at = instanceName.indexOf(QLatin1Char('@'));
    if (at >= 0) {
        const QString friendly = instanceName.mid(at + 1).trimmed();
        if (!friendly.isEmpty())
            label = friendly;
    }
    label = label.trimmed();
    return label.isEmpty() ? QStringLiteral("<unnamed>") : label;
}

QString RaopSinkArguments::disambiguatedLabel(const QString& label, int suffix)
{
    return QStringLiteral("%1 (%2)").arg(label).arg(suffix);
}

QString RaopSinkArguments::transportFor(const QString& tp)
{
    if (listContains(tp, QStringLiteral("UDP")))
        return QStringLiteral("udp");
    if (listContains(tp, QStringLiteral("TCP")))
        return QStringLiteral("tcp");
    return {};
}

QString RaopSinkArguments::encryptionFor(const QString& et)
{
    if (listContains(et, QStringLiteral("1")))
        return QStringLiteral("RSA");
    if (listContains(et, QStringLiteral("4")))
        return QStringLiteral("auth_setup");
    return {};
}

QString RaopSinkArguments::codecFor(const QString& cn)
{
    if (listContains(cn, QStringLiteral("3")))
        return QStringLiteral("AAC-ELD");
    if (listContains(cn, QStringLiteral("2")))
        return QStringLiteral("AAC");
    if (listContains(cn, QStringLiteral("1")))
        return QStringLiteral("ALAC");
    if (listContains(cn, QStringLiteral("0")))
        return QStringLiteral("PCM");
    return {};
}

QMap<QString, QString> RaopSinkArguments::build(const ResolvedEndpoint& endpoint,
                                                const QString& label) const
{
    QMap<QString, QString> props;
    props.insert(QStringLiteral("raop.ip"), endpoint.address.toString());
    props.insert(QStringLiteral("raop.ip.version"),
                 endpoint.isIPv4() ? QStringLiteral("4") : QStringLiteral("6"));
    props.insert(QStringLiteral("raop.port"), QString::number(endpoint.port));
    props.insert(QStringLiteral("raop.name"), label);
    props.insert(QStringLiteral("raop.hostname"), endpoint.hostname);

    const QString who = endpoint.instance.instanceName;

    if (endpoint.attributes.contains(QStringLiteral("tp"))) {
        const QString tp = endpoint.attribute(QStringLiteral("tp"));
        QString transport = transportFor(tp);
        if (transport.isEmpty()) {
            qCWarning(lcSinkArgs) << "[SinkArgs]" << who << "unknown transport:" << tp;
            transport = defaults_.transport;
        }
        if (!transport.isEmpty())
            props.insert(QStringLiteral("raop.transport"), transport);
    } else if (!defaults_.transport.isEmpty()) {
        props.insert(QStringLiteral("raop.transport"), defaults_.transport);
    }

    if (endpoint.attributes.contains(QStringLiteral("et"))) {
        const QString et = endpoint.attribute(QStringLiteral("et"));
        QString encryption = encryptionFor(et);
        if (encryption.isEmpty()) {
            qCWarning(lcSinkArgs) << "[SinkArgs]" << who << "unknown encryption type:" << et;
            encryption = QStringLiteral("none");
        }
        props.insert(QStringLiteral("raop.encryption.type"), encryption);
    } else if (!defaults_.encryption.isEmpty()) {
        props.insert(QStringLiteral("raop.encryption.type"), defaults_.encryption);
    }

    if (endpoint.attributes.contains(QStringLiteral("cn"))) {
        const QString cn = endpoint.attribute(QStringLiteral("cn"));
        const QString codec = codecFor(cn);
        if (codec.isEmpty())
            qCWarning(lcSinkArgs) << "[SinkArgs]" << who << "unknown codec:" << cn;
        else
            props.insert(QStringLiteral("raop.audio.codec"), codec);
    } else if (!defaults_.codec.isEmpty()) {
        props.insert(QStringLiteral("raop.audio.codec"), defaults_.codec);
    }

    const QString model = endpoint.attribute(QStringLiteral("am")).trimmed();
    if (!model.isEmpty())
        props.insert(QStringLiteral("device.model"), model);

    if (defaults_.latencyMs > 0)
        props.insert(QStringLiteral("raop.latency.ms"), QString::number(defaults_.latencyMs));

    return props;
}

} // namespace rsb
