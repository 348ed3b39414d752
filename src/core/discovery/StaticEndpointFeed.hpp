#pragma once

#include "core/discovery/IDiscoveryFeed.hpp"
#include <QList>
#include <QVariantMap>

namespace cvn {

/// Announces a fixed list of endpoints, typically from the "targets" config.
class StaticEndpointFeed : public IDiscoveryFeed {
    Q_OBJECT
public:
    explicit StaticEndpointFeed(const QList<EndpointInfo>& endpoints, QObject* parent = nullptr);

    /// Convert config entries; entries without a host are skipped.
    static QList<EndpointInfo> fromConfig(const QList<QVariantMap>& entries);

    void start() override;
    void stop() override;

    QList<EndpointInfo> endpoints() const { return endpoints_; }

private:
    QList<EndpointInfo> endpoints_;
    bool started_ = false;
};

} // namespace cvn
