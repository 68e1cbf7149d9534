#pragma once

#include "core/discovery/EndpointResolver.hpp"
#include "core/discovery/ServiceBrowser.hpp"
#include "core/reconcile/InstanceTask.hpp"
#include "core/reconcile/RetryPolicy.hpp"
#include "core/reconcile/SinkRegistry.hpp"
#include "core/sink/SinkActivator.hpp"
#include <QList>
#include <QObject>
#include <QHash>
#include <QSet>

namespace rsb {

struct ReconcilerOptions {
    RetryPolicy resolveRetry{4, 500, 2.0, 8000};
    RetryPolicy activateRetry{3, 1000, 2.0, 10000};
};

/// Turns browse announcements into sinks.
///
/// Every announcement spawns an InstanceTask unless a task for the same
/// instance is still before activation, in which case it is coalesced.
/// A resolved endpoint whose (instance, address, port) is already active or
/// being activated ends as Duplicate, as does one the media server already
/// rejected permanently. An instance that failed to resolve for a permanent
/// reason is ignored until the browser reports it stale. Successful
/// activations go into the registry; nothing is ever removed from it.
class DiscoveryReconciler : public QObject {
    Q_OBJECT
public:
    DiscoveryReconciler(ServiceBrowser* browser, EndpointResolver* resolver,
                        SinkActivator* activator, const ReconcilerOptions& options = ReconcilerOptions(),
                        QObject* parent = nullptr);
    ~DiscoveryReconciler() override;

    void start();
    /// Stop browsing and cancel backoff. drained() follows once every task
    /// has settled.
    void shutdown();

    bool isRunning() const { return running_; }
    bool isShuttingDown() const { return shuttingDown_; }
    int pendingTaskCount() const { return tasks_.size(); }
    const SinkRegistry& registry() const { return registry_; }

public slots:
    void onInstanceAnnounced(const rsb::ServiceInstance& instance, int ifindex);

signals:
    void started();
    void startFailed(const QString& reason);
    void sinkActivated(quint64 key, const rsb::SinkModule& module);
    void instanceSettled(const rsb::ServiceInstance& instance, rsb::TaskState state,
                         rsb::ErrorClass error);
    void drained();

private:
    void onTaskResolved(InstanceTask* task);
    void onTaskActivated(InstanceTask* task);
    void onTaskFinished(InstanceTask* task);
    InstanceTask* pendingTaskFor(const ServiceInstance& instance) const;

    ServiceBrowser* browser_;
    EndpointResolver* resolver_;
    SinkActivator* activator_;
    ReconcilerOptions options_;
    SinkRegistry registry_;
    QList<InstanceTask*> tasks_;
    QHash<QString, InstanceTask*> activating_;   // address key → task loading it
    QSet<QString> rejected_;                     // address keys the media server refused
    QSet<QString> unresolvable_;                 // instance keys dropped for good until stale
    bool running_ = false;
    bool shuttingDown_ = false;
    bool drained_ = false;
};

} // namespace rsb
