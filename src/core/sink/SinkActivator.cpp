#include "core/sink/SinkActivator.hpp"
#include <QDateTime>
#include <QLoggingCategory>
#include <QPointer>

Q_LOGGING_CATEGORY(lcActivator, "rsb.sink.activator")

namespace rsb {

SinkActivator::SinkActivator(IModuleLoader* loader, const ActivatorOptions& options,
                             const SinkDefaults& defaults, QObject* parent)
    : QObject(parent)
    , loader_(loader)
    , options_(options)
    , arguments_(defaults)
{
}

void SinkActivator::activate(const ResolvedEndpoint& endpoint, Callback callback)
{
    const QString label = RaopSinkArguments::deriveLabel(endpoint.instance.instanceName);
    load(endpoint, label, 1, std::move(callback));
}

void SinkActivator::load(const ResolvedEndpoint& endpoint, const QString& baseLabel, int suffix,
                         Callback callback)
{
    const QString label = suffix <= 1
        ? baseLabel
        : RaopSinkArguments::disambiguatedLabel(baseLabel, suffix);
    const QMap<QString, QString> props = arguments_.build(endpoint, label);

    QPointer<SinkActivator> self(this);
    loader_->loadModule(options_.moduleName, props,
                        [self, endpoint, baseLabel, label, suffix, callback](const LoadResult& result) {
        ActivateOutcome outcome;

        switch (result.kind) {
        case LoadErrorKind::None:
            outcome.module.handle = result.handle;
            outcome.module.label = label;
            outcome.module.endpoint = endpoint;
            outcome.module.createdAt = QDateTime::currentDateTimeUtc();
            if (suffix > 1) {
                qCInfo(lcActivator) << "[Activator]" << endpoint.instance.instanceName
                                    << "label" << baseLabel << "taken, using" << label;
            }
            callback(outcome);
            return;

        case LoadErrorKind::Unreachable:
            outcome.error = ErrorClass::TransientInfrastructure;
            outcome.retryable = true;
            outcome.message = result.message;
            callback(outcome);
            return;

        case LoadErrorKind::InvalidArguments:
            outcome.error = ErrorClass::PolicyRejected;
            outcome.message = QStringLiteral("module rejected arguments: %1").arg(result.message);
            callback(outcome);
            return;

        case LoadErrorKind::LabelCollision:
            break;
        }

        const int next = suffix <= 1 ? 2 : suffix + 1;
        if (self && self->options_.disambiguateLabels && next <= self->options_.maxLabelSuffix) {
            qCDebug(lcActivator) << "[Activator] Label" << label << "collides, trying suffix" << next;
            self->load(endpoint, baseLabel, next, callback);
            return;
        }

        outcome.error = ErrorClass::PolicyRejected;
        outcome.collision = true;
        outcome.message = QStringLiteral("label collision on '%1'").arg(label);
        callback(outcome);
    });
}

} // namespace rsb
