#include "core/net/NetworkUtil.hpp"
#include <QHostAddress>
#include <QUdpSocket>
#include <QUrl>
#include <boost/log/trivial.hpp>

namespace cvn {

QString detectOutboundAddress(const QString& probeHost, quint16 probePort)
{
    QUdpSocket socket;
    socket.connectToHost(QHostAddress(probeHost), probePort);
    if (!socket.waitForConnected(1000)) {
        BOOST_LOG_TRIVIAL(warning) << "[NetworkUtil] no route to " << probeHost.toStdString()
                                   << ": " << socket.errorString().toStdString();
        return {};
    }

    const QHostAddress local = socket.localAddress();
    socket.close();
    if (local.isNull() || local.isLoopback())
        return {};
    return local.toString();
}

QString mediaUrl(const QString& host, quint16 port, const QString& fileName, qint64 cacheToken)
{
    return QString("http://%1:%2/%3?t=%4")
        .arg(host)
        .arg(port)
        .arg(QString::fromUtf8(QUrl::toPercentEncoding(fileName)))
        .arg(cacheToken);
}

} // namespace cvn
