#pragma once

#include "core/bus/IResolveBus.hpp"
#include "core/discovery/ServiceInstance.hpp"
#include <QObject>
#include <functional>

namespace rsb {

enum class AddressFamilyPolicy {
    Any,
    IPv4Only,
    IPv6Only
};

struct ResolverOptions {
    AddressFamilyPolicy family = AddressFamilyPolicy::Any;
    uint64_t flags = 0;
};

/// Result of a single resolution attempt.
struct ResolveOutcome {
    ErrorClass error = ErrorClass::None;
    bool retryable = false;
    QString message;
    ResolvedEndpoint endpoint;

    bool ok() const { return error == ErrorClass::None; }
};

/// Turns a service instance into a ResolvedEndpoint through one
/// ResolveService call. Retrying is left to the caller.
class EndpointResolver : public QObject {
    Q_OBJECT
public:
    using Callback = std::function<void(const ResolveOutcome&)>;

    EndpointResolver(IResolveBus* bus, const ResolverOptions& options, QObject* parent = nullptr);

    /// Single attempt. The callback always runs from the event loop.
    void resolve(const ServiceInstance& instance, int ifindex, Callback callback);

    const ResolverOptions& options() const { return options_; }

    static bool isValidInstance(const ServiceInstance& instance, QString* reason = nullptr);
    static QMap<QString, QString> parseAttributes(const QList<QByteArray>& txt);
    static ResolveOutcome buildEndpoint(const ServiceInstance& instance,
                                        const BusServiceReply& reply,
                                        AddressFamilyPolicy family = AddressFamilyPolicy::Any);
    static int familyToAf(AddressFamilyPolicy family);

private:
    IResolveBus* bus_;
    ResolverOptions options_;
};

} // namespace rsb
