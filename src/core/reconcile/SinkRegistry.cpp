#include "core/reconcile/SinkRegistry.hpp"

namespace rsb {

quint64 SinkRegistry::insert(const SinkModule& module)
{
    QMutexLocker lock(&mutex_);
    const quint64 key = nextKey_++;
    entries_.insert(key, module);
    return key;
}

int SinkRegistry::size() const
{
    QMutexLocker lock(&mutex_);
    return entries_.size();
}

QList<SinkModule> SinkRegistry::modules() const
{
    QMutexLocker lock(&mutex_);
    return entries_.values();
}

bool SinkRegistry::find(quint64 key, SinkModule* module) const
{
    QMutexLocker lock(&mutex_);
    auto it = entries_.constFind(key);
    if (it == entries_.constEnd())
        return false;
    if (module)
        *module = it.value();
    return true;
}

bool SinkRegistry::containsAddress(const QString& addressKey) const
{
    QMutexLocker lock(&mutex_);
    for (const auto& entry : entries_) {
        if (entry.endpoint.addressKey() == addressKey)
            return true;
    }
    return false;
}

bool SinkRegistry::containsLabel(const QString& label) const
{
    QMutexLocker lock(&mutex_);
    for (const auto& entry : entries_) {
        if (entry.label == label)
            return true;
    }
    return false;
}

int SinkRegistry::countFor(const ServiceInstance& instance) const
{
    QMutexLocker lock(&mutex_);
    int count = 0;
    for (const auto& entry : entries_) {
        if (entry.endpoint.instance == instance)
            ++count;
    }
    return count;
}

} // namespace rsb
