#pragma once

#include "core/discovery/ServiceInstance.hpp"
#include <QList>
#include <QMap>
#include <QMutex>

namespace rsb {

/// Append-only record of the sinks this process created.
///
/// Keys are assigned monotonically from 1. Entries are never removed; an
/// identity may own several entries, one per distinct (address, port).
/// Thread-safe.
class SinkRegistry {
public:
    quint64 insert(const SinkModule& module);

    int size() const;
    bool isEmpty() const { return size() == 0; }
    QList<SinkModule> modules() const;
    bool find(quint64 key, SinkModule* module) const;

    /// Whether (identity, address, port) already has a sink.
    bool containsAddress(const QString& addressKey) const;
    bool containsLabel(const QString& label) const;
    int countFor(const ServiceInstance& instance) const;

private:
    mutable QMutex mutex_;
    QMap<quint64, SinkModule> entries_;
    quint64 nextKey_ = 1;
};

} // namespace rsb
