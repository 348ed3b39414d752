#include "core/cast/CastTargetManager.hpp"
#include "core/discovery/DeviceClass.hpp"
#include "core/discovery/IDiscoveryFeed.hpp"
#include "core/notify/TargetRegistry.hpp"
#include <ocast/Transport/TLSTransport.hpp>
#include <boost/log/trivial.hpp>

namespace cvn {

CastTargetManager::CastTargetManager(IDiscoveryFeed& feed, TargetRegistry& registry,
                                     const CastTargetConfig& config, QObject* parent)
    : QObject(parent)
    , registry_(registry)
    , config_(config)
    , transportFactory_([](const EndpointInfo& endpoint) -> ocast::ITransport* {
        return new ocast::TLSTransport(endpoint.host, endpoint.port);
    })
{
    connect(&feed, &IDiscoveryFeed::endpointFound, this, &CastTargetManager::onEndpointFound);
    connect(&feed, &IDiscoveryFeed::endpointLost, this, &CastTargetManager::onEndpointLost);
}

CastTargetManager::~CastTargetManager()
{
    stopAll();
}

void CastTargetManager::stopAll()
{
    for (auto it = targets_.begin(); it != targets_.end(); ++it) {
        it.value()->stop();
        registry_.remove(it.key());
    }
    targets_.clear();
}

void CastTargetManager::onEndpointFound(const cvn::EndpointInfo& endpoint)
{
    // Hand-configured endpoints may leave the model out
    if (!endpoint.model.isEmpty() && !isAudioModel(endpoint.model)) {
        BOOST_LOG_TRIVIAL(debug) << "[CastTargetManager] ignoring '" << endpoint.name.toStdString()
                                 << "' (model '" << endpoint.model.toStdString() << "')";
        return;
    }

    auto* transport = transportFactory_(endpoint);
    std::shared_ptr<CastTarget> target(new CastTarget(endpoint, transport, config_),
                                       [](CastTarget* t) { t->deleteLater(); });

    auto previous = targets_.value(endpoint.id);
    if (previous) {
        BOOST_LOG_TRIVIAL(info) << "[CastTargetManager] replacing target '" << endpoint.id.toStdString() << "'";
        previous->stop();
    } else {
        BOOST_LOG_TRIVIAL(info) << "[CastTargetManager] new target '" << endpoint.name.toStdString()
                                << "' (" << endpoint.model.toStdString() << ") at "
                                << endpoint.host.toStdString() << ":" << endpoint.port;
    }

    targets_.insert(endpoint.id, target);
    registry_.upsert(target);
    target->start();
}

void CastTargetManager::onEndpointLost(const QString& id)
{
    auto target = targets_.take(id);
    if (!target)
        return;

    BOOST_LOG_TRIVIAL(info) << "[CastTargetManager] target '" << id.toStdString() << "' lost";
    target->stop();
    registry_.remove(id);
}

} // namespace cvn
