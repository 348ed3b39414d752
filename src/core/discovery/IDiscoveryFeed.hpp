#pragma once

#include "core/discovery/EndpointInfo.hpp"
#include <QObject>

namespace cvn {

/// Source of "endpoint appeared / disappeared" events.
class IDiscoveryFeed : public QObject {
    Q_OBJECT
public:
    using QObject::QObject;
    ~IDiscoveryFeed() override = default;

    virtual void start() = 0;
    virtual void stop() = 0;

signals:
    void endpointFound(const cvn::EndpointInfo& endpoint);
    void endpointLost(const QString& id);
};

} // namespace cvn
