#include "core/reconcile/DiscoveryReconciler.hpp"
#include <QLoggingCategory>
#include <QMetaObject>

Q_LOGGING_CATEGORY(lcReconciler, "rsb.reconcile")

namespace rsb {

DiscoveryReconciler::DiscoveryReconciler(ServiceBrowser* browser, EndpointResolver* resolver,
                                         SinkActivator* activator, const ReconcilerOptions& options,
                                         QObject* parent)
    : QObject(parent)
    , browser_(browser)
    , resolver_(resolver)
    , activator_(activator)
    , options_(options)
{
    connect(browser_, &ServiceBrowser::instanceAnnounced,
            this, &DiscoveryReconciler::onInstanceAnnounced);
    connect(browser_, &ServiceBrowser::started, this, [this]() {
        qCInfo(lcReconciler) << "[Reconciler] Browse subscription established";
        emit started();
    });
    connect(browser_, &ServiceBrowser::startFailed, this, [this](const QString& reason) {
        running_ = false;
        qCCritical(lcReconciler) << "[Reconciler]" << errorClassName(ErrorClass::FatalStartup)
                                 << "- browse subscription failed:" << reason;
        emit startFailed(reason);
    });
    connect(browser_, &ServiceBrowser::instanceStale, this, [this](const ServiceInstance& instance) {
        if (unresolvable_.remove(instance.key()))
            qCDebug(lcReconciler) << "[Reconciler]" << instance.instanceName
                                  << "left the network, will resolve it again when it returns";
    });
}

DiscoveryReconciler::~DiscoveryReconciler()
{
    // Tasks are children; make sure none calls back into a half-destroyed reconciler
    for (auto* task : tasks_)
        disconnect(task, nullptr, this, nullptr);
}

void DiscoveryReconciler::start()
{
    if (running_ || shuttingDown_)
        return;
    running_ = true;
    qCInfo(lcReconciler) << "[Reconciler] Starting";
    browser_->start();
}

void DiscoveryReconciler::shutdown()
{
    if (shuttingDown_)
        return;
    shuttingDown_ = true;
    running_ = false;

    qCInfo(lcReconciler) << "[Reconciler] Shutting down," << tasks_.size() << "tasks pending,"
                         << registry_.size() << "sinks active";
    browser_->stop();

    // cancel() may finish a task synchronously, which edits tasks_
    const QList<InstanceTask*> tasks = tasks_;
    for (auto* task : tasks)
        task->cancel();

    if (tasks_.isEmpty() && !drained_) {
        drained_ = true;
        QMetaObject::invokeMethod(this, [this]() { emit drained(); }, Qt::QueuedConnection);
    }
}

InstanceTask* DiscoveryReconciler::pendingTaskFor(const ServiceInstance& instance) const
{
    for (auto* task : tasks_) {
        if (task->isBeforeActivation() && task->instance() == instance)
            return task;
    }
    return nullptr;
}

void DiscoveryReconciler::onInstanceAnnounced(const ServiceInstance& instance, int ifindex)
{
    if (shuttingDown_)
        return;

    if (unresolvable_.contains(instance.key()))
        return;

    if (InstanceTask* pending = pendingTaskFor(instance)) {
        qCDebug(lcReconciler) << "[Reconciler] Coalescing announcement of" << instance.instanceName
                              << "(task" << taskStateName(pending->state()) << ")";
        return;
    }

    // Resolve on the configured interface (0 = any), not only the one that
    // answered the browse query
    auto* task = new InstanceTask(instance, browser_->options().ifindex, resolver_, activator_,
                                  options_.resolveRetry, options_.activateRetry, this);
    connect(task, &InstanceTask::resolved, this, &DiscoveryReconciler::onTaskResolved);
    connect(task, &InstanceTask::activated, this, &DiscoveryReconciler::onTaskActivated);
    connect(task, &InstanceTask::finished, this, &DiscoveryReconciler::onTaskFinished);
    tasks_.append(task);

    qCDebug(lcReconciler) << "[Reconciler] New task for" << instance.fullName() << "seen on ifindex" << ifindex;
    task->start();
}

void DiscoveryReconciler::onTaskResolved(InstanceTask* task)
{
    const QString key = task->endpoint().addressKey();
    if (registry_.containsAddress(key) || activating_.contains(key)) {
        task->markDuplicate();
        return;
    }
    if (rejected_.contains(key)) {
        task->markDuplicate(QStringLiteral("activation was rejected before"));
        return;
    }

    activating_.insert(key, task);
    task->beginActivation();
}

void DiscoveryReconciler::onTaskActivated(InstanceTask* task)
{
    const SinkModule& module = task->module();
    const quint64 key = registry_.insert(module);
    activating_.remove(module.endpoint.addressKey());

    qCInfo(lcReconciler).noquote() << "[Reconciler] Sink" << module.label << "created for"
                                   << module.endpoint.instance.instanceName << "at"
                                   << module.endpoint.address.toString() + QLatin1Char(':')
                                          + QString::number(module.endpoint.port)
                                   << "(module" << module.handle << ", entry" << key << ")";
    emit sinkActivated(key, module);
}

void DiscoveryReconciler::onTaskFinished(InstanceTask* task)
{
    // Release the address claim unless another task holds it
    const QString key = task->endpoint().addressKey();
    if (activating_.value(key) == task)
        activating_.remove(key);

    // Permanent activation failures are not retried on re-announcement
    if (task->state() == TaskState::Failed && task->error() == ErrorClass::PolicyRejected)
        rejected_.insert(key);

    // Permanent resolution failures wait until the browser reports the instance gone
    if (task->state() == TaskState::Dropped && !task->isCancelled()
        && (task->error() == ErrorClass::PolicyRejected || task->error() == ErrorClass::MalformedInput)) {
        unresolvable_.insert(task->instance().key());
    }

    tasks_.removeOne(task);
    emit instanceSettled(task->instance(), task->state(), task->error());
    task->deleteLater();

    if (shuttingDown_ && tasks_.isEmpty() && !drained_) {
        drained_ = true;
        qCInfo(lcReconciler) << "[Reconciler] Drained," << registry_.size() << "sinks tracked";
        emit drained();
    }
}

} // namespace rsb
