#pragma once

#include "core/bus/IResolveBus.hpp"
#include "core/discovery/ServiceInstance.hpp"
#include <QHash>
#include <QObject>
#include <QTimer>

namespace rsb {

struct BrowseOptions {
    QString serviceType = QStringLiteral("_raop._tcp");
    QString domain = QStringLiteral("local");
    int ifindex = 0;
    uint64_t flags = 0;
    int pollIntervalMs = 3000;
    int staleGracePolls = 8;
};

/// Browse subscription over systemd-resolved.
///
/// resolved exposes no browse stream on the bus, so the browser polls the
/// PTR record of the service type and emits instanceAnnounced() for every
/// valid instance on every poll. Identities missing from a poll are kept for
/// staleGracePolls polls before they are reported as gone; that is logged
/// only, nothing downstream reacts to it.
class ServiceBrowser : public QObject {
    Q_OBJECT
public:
    ServiceBrowser(IResolveBus* bus, const BrowseOptions& options, QObject* parent = nullptr);
    ~ServiceBrowser() override;

    void start();
    void stop();
    bool isActive() const { return active_; }

    const BrowseOptions& options() const { return options_; }
    int knownInstanceCount() const { return known_.size(); }
    int pollCount() const { return polls_; }

    /// Splits a PTR target ("Kitchen._raop._tcp.local") into an instance.
    /// Returns false if the name is not under the browsed type/domain.
    bool instanceFromLabels(const QStringList& labels, ServiceInstance* instance) const;

signals:
    /// First poll succeeded, the subscription is established.
    void started();
    /// First poll failed on an unreachable bus; the browser stops itself.
    void startFailed(const QString& reason);
    void instanceAnnounced(const rsb::ServiceInstance& instance, int ifindex);
    void instanceAdded(const rsb::ServiceInstance& instance);
    void instanceStale(const rsb::ServiceInstance& instance);

private:
    void poll();
    void onRecords(quint64 generation, const BusError& error, const QList<BusRecord>& records);

    struct Tracked {
        ServiceInstance instance;
        int missedPolls = 0;
    };

    IResolveBus* bus_;
    BrowseOptions options_;
    QTimer pollTimer_;
    bool active_ = false;
    bool established_ = false;
    bool pollInFlight_ = false;
    quint64 generation_ = 0;
    int polls_ = 0;
    QHash<QString, Tracked> known_;
};

} // namespace rsb
