#pragma once

#include "core/cast/CastTarget.hpp"
#include "core/discovery/EndpointInfo.hpp"
#include <QHash>
#include <QObject>
#include <functional>
#include <memory>

namespace ocast {
class ITransport;
}

namespace cvn {

class IDiscoveryFeed;
class TargetRegistry;

/// Turns discovery events into CastTargets in the registry.
/// Endpoints whose model is known and not a speaker are ignored.
class CastTargetManager : public QObject {
    Q_OBJECT
public:
    using TransportFactory = std::function<ocast::ITransport*(const EndpointInfo&)>;

    CastTargetManager(IDiscoveryFeed& feed, TargetRegistry& registry,
                      const CastTargetConfig& config, QObject* parent = nullptr);
    ~CastTargetManager() override;

    /// Replace the TLS transport (tests use ReplayTransport).
    void setTransportFactory(TransportFactory factory) { transportFactory_ = std::move(factory); }

    /// Stop and drop every managed target.
    void stopAll();

    std::shared_ptr<CastTarget> target(const QString& id) const { return targets_.value(id); }
    int count() const { return targets_.size(); }

private:
    void onEndpointFound(const cvn::EndpointInfo& endpoint);
    void onEndpointLost(const QString& id);

    TargetRegistry& registry_;
    CastTargetConfig config_;
    TransportFactory transportFactory_;
    QHash<QString, std::shared_ptr<CastTarget>> targets_;
};

} // namespace cvn
