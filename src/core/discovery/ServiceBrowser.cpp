#include "core/discovery/ServiceBrowser.hpp"
#include "core/discovery/DnsRecord.hpp"
#include <QLoggingCategory>
#include <QPointer>
#include <QSet>

Q_LOGGING_CATEGORY(lcBrowser, "rsb.discovery.browser")

namespace rsb {

ServiceBrowser::ServiceBrowser(IResolveBus* bus, const BrowseOptions& options, QObject* parent)
    : QObject(parent)
    , bus_(bus)
    , options_(options)
{
    pollTimer_.setSingleShot(false);
    connect(&pollTimer_, &QTimer::timeout, this, &ServiceBrowser::poll);
}

ServiceBrowser::~ServiceBrowser()
{
    stop();
}

void ServiceBrowser::start()
{
    if (active_)
        return;

    active_ = true;
    established_ = false;
    ++generation_;
    qCInfo(lcBrowser) << "[Browser] Browsing" << options_.serviceType + QLatin1Char('.') + options_.domain
                      << "every" << options_.pollIntervalMs << "ms";

    pollTimer_.start(options_.pollIntervalMs);
    poll();  // First poll immediately
}

void ServiceBrowser::stop()
{
    if (!active_)
        return;
    active_ = false;
    pollInFlight_ = false;
    ++generation_;  // replies of earlier polls are ignored from now on
    pollTimer_.stop();
    qCInfo(lcBrowser) << "[Browser] Stopped after" << polls_ << "polls";
}

bool ServiceBrowser::instanceFromLabels(const QStringList& labels, ServiceInstance* instance) const
{
    const QStringList typeLabels = options_.serviceType.split(QLatin1Char('.'));
    const QStringList domainLabels = options_.domain.split(QLatin1Char('.'));
    const int suffixLength = typeLabels.size() + domainLabels.size();

    // instance labels may contain dots in their text but are a single wire label
    if (labels.size() != suffixLength + 1)
        return false;

    for (int i = 0; i < typeLabels.size(); ++i) {
        if (labels.at(1 + i).compare(typeLabels.at(i), Qt::CaseInsensitive) != 0)
            return false;
    }
    for (int i = 0; i < domainLabels.size(); ++i) {
        if (labels.at(1 + typeLabels.size() + i).compare(domainLabels.at(i), Qt::CaseInsensitive) != 0)
            return false;
    }

    instance->instanceName = labels.first();
    instance->serviceType = options_.serviceType;
    instance->domain = options_.domain;
    return true;
}

void ServiceBrowser::poll()
{
    if (!active_ || pollInFlight_)
        return;

    pollInFlight_ = true;
    const quint64 generation = generation_;
    QPointer<ServiceBrowser> self(this);
    const QString name = options_.serviceType + QLatin1Char('.') + options_.domain;

    bus_->resolveRecord(options_.ifindex, name, dns::kClassIN, dns::kTypePTR, options_.flags,
                        [self, generation](const BusError& error, const QList<BusRecord>& records) {
        if (self)
            self->onRecords(generation, error, records);
    });
}

void ServiceBrowser::onRecords(quint64 generation, const BusError& error,
                               const QList<BusRecord>& records)
{
    if (generation != generation_ || !active_)
        return;
    pollInFlight_ = false;
    ++polls_;

    if (error.isError()) {
        if (!established_ && error.kind == BusErrorKind::Unreachable) {
            qCCritical(lcBrowser) << "[Browser] Cannot reach name-resolution service:"
                                  << error.name << error.message;
            const QString reason = error.message.isEmpty() ? error.name : error.message;
            stop();
            emit startFailed(reason);
            return;
        }
        if (error.kind == BusErrorKind::NotFound || error.kind == BusErrorKind::Timeout) {
            // Nobody answered the PTR query this round
            qCDebug(lcBrowser) << "[Browser] No instances this poll:" << error.name;
        } else {
            qCWarning(lcBrowser) << "[Browser] Poll failed:" << error.name << error.message;
        }
    }

    if (!established_) {
        established_ = true;
        emit started();
    }

    // A failed poll carries no information about presence
    if (error.isError() && error.kind != BusErrorKind::NotFound)
        return;

    QSet<QString> seen;
    for (const auto& record : records) {
        if (record.klass != dns::kClassIN || record.type != dns::kTypePTR) {
            qCWarning(lcBrowser) << "[Browser] Unexpected class/type in PTR reply:"
                                 << record.klass << record.type;
            continue;
        }

        auto rr = dns::parseResourceRecord(record.data);
        if (!rr) {
            qCWarning(lcBrowser) << "[Browser] Dropping undecodable record ("
                                 << record.data.size() << "bytes)";
            continue;
        }
        if (rr->klass != dns::kClassIN || rr->type != dns::kTypePTR) {
            qCWarning(lcBrowser) << "[Browser] Unexpected class/type in record data:"
                                 << rr->klass << rr->type;
            continue;
        }

        auto target = dns::parseName(rr->rdata, 0);
        if (!target) {
            qCWarning(lcBrowser) << "[Browser] Dropping PTR with undecodable target";
            continue;
        }

        ServiceInstance instance;
        if (!instanceFromLabels(*target, &instance)) {
            qCWarning(lcBrowser) << "[Browser] PTR target outside browsed type:"
                                 << dns::joinName(*target);
            continue;
        }

        const QString key = instance.key();
        if (seen.contains(key))
            continue;
        seen.insert(key);

        auto it = known_.find(key);
        if (it == known_.end()) {
            known_.insert(key, Tracked{instance, 0});
            qCInfo(lcBrowser) << "[Browser] added host:" << instance.fullName()
                              << "ifindex" << record.ifindex;
            emit instanceAdded(instance);
        } else {
            it->missedPolls = 0;
        }

        emit instanceAnnounced(instance, record.ifindex);
        if (generation != generation_ || !active_)
            return;  // a receiver stopped us
    }

    // Grace period before calling an instance gone (mDNS cache flushes et cetera)
    for (auto it = known_.begin(); it != known_.end();) {
        if (seen.contains(it.key())) {
            ++it;
            continue;
        }
        if (++it->missedPolls > options_.staleGracePolls) {
            qCInfo(lcBrowser) << "[Browser] removed host:" << it->instance.fullName();
            const ServiceInstance gone = it->instance;
            it = known_.erase(it);
            emit instanceStale(gone);
        } else {
            ++it;
        }
    }
}

} // namespace rsb
