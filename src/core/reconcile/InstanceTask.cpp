#include "core/reconcile/InstanceTask.hpp"
#include <QLoggingCategory>
#include <QPointer>

Q_LOGGING_CATEGORY(lcTask, "rsb.reconcile.task")

namespace rsb {

const char* taskStateName(TaskState state)
{
    switch (state) {
    case TaskState::Announced:  return "announced";
    case TaskState::Resolving:  return "resolving";
    case TaskState::Resolved:   return "resolved";
    case TaskState::Activating: return "activating";
    case TaskState::Active:     return "active";
    case TaskState::Dropped:    return "dropped";
    case TaskState::Failed:     return "failed";
    case TaskState::Duplicate:  return "duplicate";
    }
    return "unknown";
}

InstanceTask::InstanceTask(const ServiceInstance& instance, int ifindex,
                           EndpointResolver* resolver, SinkActivator* activator,
                           const RetryPolicy& resolveRetry, const RetryPolicy& activateRetry,
                           QObject* parent)
    : QObject(parent)
    , instance_(instance)
    , ifindex_(ifindex)
    , resolver_(resolver)
    , activator_(activator)
    , resolveRetry_(resolveRetry)
    , activateRetry_(activateRetry)
{
    backoffTimer_ = new QTimer(this);
    backoffTimer_->setSingleShot(true);
    connect(backoffTimer_, &QTimer::timeout, this, &InstanceTask::retry);
}

bool InstanceTask::isTerminal() const
{
    return state_ == TaskState::Active || state_ == TaskState::Dropped
        || state_ == TaskState::Failed || state_ == TaskState::Duplicate;
}

bool InstanceTask::isBeforeActivation() const
{
    return state_ == TaskState::Announced || state_ == TaskState::Resolving
        || state_ == TaskState::Resolved;
}

void InstanceTask::start()
{
    if (state_ != TaskState::Announced)
        return;
    state_ = TaskState::Resolving;
    attemptResolve();
}

void InstanceTask::beginActivation()
{
    if (state_ != TaskState::Resolved)
        return;
    if (cancelled_) {
        finish(TaskState::Dropped, ErrorClass::None, QStringLiteral("cancelled before activation"));
        return;
    }
    state_ = TaskState::Activating;
    attemptActivate();
}

void InstanceTask::markDuplicate(const QString& reason)
{
    if (state_ != TaskState::Resolved)
        return;
    finish(TaskState::Duplicate, ErrorClass::None,
           reason.isEmpty() ? QStringLiteral("endpoint already has a sink") : reason);
}

void InstanceTask::cancel()
{
    if (isTerminal() || cancelled_)
        return;
    cancelled_ = true;

    if (callInFlight_)
        return;  // settles in the outcome handler

    backoffTimer_->stop();
    const TaskState terminal = state_ == TaskState::Activating ? TaskState::Failed : TaskState::Dropped;
    finish(terminal, error_, QStringLiteral("cancelled"));
}

void InstanceTask::retry()
{
    if (cancelled_)
        return;
    if (state_ == TaskState::Resolving)
        attemptResolve();
    else if (state_ == TaskState::Activating)
        attemptActivate();
}

bool InstanceTask::scheduleRetry(const RetryPolicy& policy, int attemptsMade)
{
    if (!policy.canRetry(attemptsMade))
        return false;
    const int delay = policy.delayBefore(attemptsMade + 1);
    if (delay < 0)
        return false;
    backoffTimer_->start(delay);
    return true;
}

void InstanceTask::attemptResolve()
{
    ++resolveAttempts_;
    callInFlight_ = true;
    QPointer<InstanceTask> self(this);
    resolver_->resolve(instance_, ifindex_, [self](const ResolveOutcome& outcome) {
        if (self)
            self->onResolveOutcome(outcome);
    });
}

void InstanceTask::onResolveOutcome(const ResolveOutcome& outcome)
{
    callInFlight_ = false;

    if (outcome.ok()) {
        endpoint_ = outcome.endpoint;
        state_ = TaskState::Resolved;
        if (cancelled_) {
            finish(TaskState::Dropped, ErrorClass::None, QStringLiteral("cancelled after resolution"));
            return;
        }
        emit resolved(this);
        return;
    }

    error_ = outcome.error;
    message_ = outcome.message;

    if (!cancelled_ && outcome.retryable && scheduleRetry(resolveRetry_, resolveAttempts_)) {
        qCDebug(lcTask) << "[Task]" << instance_.instanceName << "resolve attempt" << resolveAttempts_
                        << "failed (" << outcome.message << "), retrying in"
                        << backoffTimer_->interval() << "ms";
        return;
    }

    finish(TaskState::Dropped, outcome.error, outcome.message);
}

void InstanceTask::attemptActivate()
{
    ++activateAttempts_;
    callInFlight_ = true;
    QPointer<InstanceTask> self(this);
    activator_->activate(endpoint_, [self](const ActivateOutcome& outcome) {
        if (self)
            self->onActivateOutcome(outcome);
    });
}

void InstanceTask::onActivateOutcome(const ActivateOutcome& outcome)
{
    callInFlight_ = false;

    if (outcome.ok()) {
        module_ = outcome.module;
        state_ = TaskState::Active;
        error_ = ErrorClass::None;
        message_.clear();
        emit activated(this);
        emit finished(this);
        return;
    }

    error_ = outcome.error;
    message_ = outcome.message;

    if (!cancelled_ && outcome.retryable && scheduleRetry(activateRetry_, activateAttempts_)) {
        qCDebug(lcTask) << "[Task]" << instance_.instanceName << "activation attempt"
                        << activateAttempts_ << "failed (" << outcome.message << "), retrying in"
                        << backoffTimer_->interval() << "ms";
        return;
    }

    finish(TaskState::Failed, outcome.error, outcome.message);
}

void InstanceTask::finish(TaskState state, ErrorClass error, const QString& message)
{
    backoffTimer_->stop();
    state_ = state;
    error_ = error;
    message_ = message;

    const QString who = instance_.instanceName;
    if (cancelled_) {
        qCInfo(lcTask) << "[Task]" << who << taskStateName(state) << "on shutdown:" << message;
    } else if (state == TaskState::Duplicate) {
        qCDebug(lcTask) << "[Task]" << who << endpoint_.address.toString() << endpoint_.port
                        << "skipped:" << message;
    } else if (error == ErrorClass::TransientInfrastructure) {
        const int attempts = state == TaskState::Dropped ? resolveAttempts_ : activateAttempts_;
        qCWarning(lcTask) << "[Task]" << who << taskStateName(state) << "after" << attempts
                          << "attempts:" << message;
    } else if (error == ErrorClass::PolicyRejected && state == TaskState::Dropped) {
        qCInfo(lcTask) << "[Task]" << who << "skipped:" << message;
    } else if (error != ErrorClass::None) {
        qCWarning(lcTask) << "[Task]" << who << taskStateName(state)
                          << "(" << errorClassName(error) << "):" << message;
    }

    emit finished(this);
}

} // namespace rsb
