#pragma once

#include <QString>

namespace cvn {

/// Local IPv4 address of the interface that routes to the public internet.
/// Uses a "connected" UDP socket; nothing is sent. Empty on failure.
QString detectOutboundAddress(const QString& probeHost = QStringLiteral("8.8.8.8"),
                              quint16 probePort = 1);

/// http://<host>:<port>/<fileName>?t=<cacheToken>
QString mediaUrl(const QString& host, quint16 port, const QString& fileName, qint64 cacheToken);

} // namespace cvn
