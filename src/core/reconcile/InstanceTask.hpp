#pragma once

#include "core/discovery/EndpointResolver.hpp"
#include "core/discovery/ServiceInstance.hpp"
#include "core/reconcile/RetryPolicy.hpp"
#include "core/sink/SinkActivator.hpp"
#include <QObject>
#include <QTimer>

namespace rsb {

/// Announced → Resolving → Resolved → Activating → Active, with the terminal
/// states Dropped (resolution gave up), Failed (activation gave up) and
/// Duplicate (endpoint already handled). Nothing leaves Active.
enum class TaskState {
    Announced,
    Resolving,
    Resolved,
    Activating,
    Active,
    Dropped,
    Failed,
    Duplicate
};

const char* taskStateName(TaskState state);

/// Drives one announcement of one instance through resolution and
/// activation, including backoff between attempts.
///
/// The owner decides what happens after resolution: it must answer
/// resolved() with either beginActivation() or markDuplicate().
class InstanceTask : public QObject {
    Q_OBJECT
public:
    InstanceTask(const ServiceInstance& instance, int ifindex,
                 EndpointResolver* resolver, SinkActivator* activator,
                 const RetryPolicy& resolveRetry, const RetryPolicy& activateRetry,
                 QObject* parent = nullptr);

    void start();
    void beginActivation();
    void markDuplicate(const QString& reason = QString());

    /// Stops pending backoff. A call already in flight is allowed to
    /// finish; a sink it creates is kept and reported as usual.
    void cancel();

    TaskState state() const { return state_; }
    bool isTerminal() const;
    /// Still coalescing new announcements of the same instance.
    bool isBeforeActivation() const;
    bool isCancelled() const { return cancelled_; }

    const ServiceInstance& instance() const { return instance_; }
    int ifindex() const { return ifindex_; }
    const ResolvedEndpoint& endpoint() const { return endpoint_; }
    const SinkModule& module() const { return module_; }
    ErrorClass error() const { return error_; }
    const QString& message() const { return message_; }
    int resolveAttempts() const { return resolveAttempts_; }
    int activateAttempts() const { return activateAttempts_; }

signals:
    void resolved(rsb::InstanceTask* task);
    void activated(rsb::InstanceTask* task);
    void finished(rsb::InstanceTask* task);

private:
    void retry();
    void attemptResolve();
    void onResolveOutcome(const ResolveOutcome& outcome);
    void attemptActivate();
    void onActivateOutcome(const ActivateOutcome& outcome);
    bool scheduleRetry(const RetryPolicy& policy, int attemptsMade);
    void finish(TaskState state, ErrorClass error, const QString& message);

    ServiceInstance instance_;
    int ifindex_;
    EndpointResolver* resolver_;
    SinkActivator* activator_;
    RetryPolicy resolveRetry_;
    RetryPolicy activateRetry_;

    TaskState state_ = TaskState::Announced;
    ResolvedEndpoint endpoint_;
    SinkModule module_;
    ErrorClass error_ = ErrorClass::None;
    QString message_;
    int resolveAttempts_ = 0;
    int activateAttempts_ = 0;
    bool callInFlight_ = false;
    bool cancelled_ = false;
    QTimer* backoffTimer_ = nullptr;
};

} // namespace rsb

Q_DECLARE_METATYPE(rsb::TaskState)
