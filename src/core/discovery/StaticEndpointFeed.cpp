#include "core/discovery/StaticEndpointFeed.hpp"
#include <QDebug>

namespace cvn {

StaticEndpointFeed::StaticEndpointFeed(const QList<EndpointInfo>& endpoints, QObject* parent)
    : IDiscoveryFeed(parent)
    , endpoints_(endpoints)
{
}

QList<EndpointInfo> StaticEndpointFeed::fromConfig(const QList<QVariantMap>& entries)
{
    QList<EndpointInfo> result;
    for (const auto& entry : entries) {
        EndpointInfo info;
        info.host = entry.value("host").toString().trimmed();
        if (info.host.isEmpty()) {
            qWarning() << "[StaticEndpointFeed] target without host ignored:" << entry;
            continue;
        }
        info.port = static_cast<quint16>(entry.value("port", 8009).toInt());
        info.id = entry.value("id").toString().trimmed();
        if (info.id.isEmpty())
            info.id = QString("%1-%2").arg(info.host).arg(info.port);
        info.name = entry.value("name", info.id).toString();
        info.model = entry.value("model").toString();
        result.append(info);
    }
    return result;
}

void StaticEndpointFeed::start()
{
    if (started_) return;
    started_ = true;
    for (const auto& endpoint : endpoints_)
        emit endpointFound(endpoint);
}

void StaticEndpointFeed::stop()
{
    if (!started_) return;
    started_ = false;
    for (const auto& endpoint : endpoints_)
        emit endpointLost(endpoint.id);
}

} // namespace cvn
