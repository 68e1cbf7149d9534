#pragma once

#include "core/discovery/ServiceInstance.hpp"
#include "core/sink/IModuleLoader.hpp"
#include "core/sink/RaopSinkArguments.hpp"
#include <QObject>
#include <functional>

namespace rsb {

struct ActivatorOptions {
    QString moduleName = QStringLiteral("libpipewire-module-raop-sink");
    bool disambiguateLabels = true;
    int maxLabelSuffix = 9;
};

/// Result of one activation attempt.
struct ActivateOutcome {
    ErrorClass error = ErrorClass::None;
    bool retryable = false;
    bool collision = false;  // gave up on a label collision
    QString message;
    SinkModule module;       // valid when ok()

    bool ok() const { return error == ErrorClass::None; }
};

/// Creates one RAOP sink in the media server for a resolved endpoint.
///
/// A label collision is retried right away with "<label> (2)", "<label> (3)"
/// and so on when disambiguation is enabled; those retries belong to the
/// same attempt. Backoff on an unreachable media server is the caller's job.
class SinkActivator : public QObject {
    Q_OBJECT
public:
    using Callback = std::function<void(const ActivateOutcome&)>;

    SinkActivator(IModuleLoader* loader, const ActivatorOptions& options,
                  const SinkDefaults& defaults = SinkDefaults(), QObject* parent = nullptr);

    void activate(const ResolvedEndpoint& endpoint, Callback callback);

    const ActivatorOptions& options() const { return options_; }
    const RaopSinkArguments& arguments() const { return arguments_; }

private:
    void load(const ResolvedEndpoint& endpoint, const QString& baseLabel, int suffix,
              Callback callback);

    IModuleLoader* loader_;
    ActivatorOptions options_;
    RaopSinkArguments arguments_;
};

} // namespace rsb
