#include <ocast/Transport/TLSTransport.hpp>
#include <QDebug>

namespace ocast {

TLSTransport::TLSTransport(const QString& host, quint16 port, QObject* parent)
    : ITransport(parent)
    , host_(host)
    , port_(port)
{
}

TLSTransport::~TLSTransport()
{
    stop();
}

void TLSTransport::start()
{
    if (!socket_) {
        socket_ = new QSslSocket(this);
        socket_->setPeerVerifyMode(QSslSocket::VerifyNone);
        connectSocketSignals();
    }
    if (socket_->state() != QAbstractSocket::UnconnectedState)
        return;

    qDebug() << "[TLSTransport] connecting to" << host_ << ":" << port_;
    socket_->connectToHostEncrypted(host_, port_);
}

void TLSTransport::stop()
{
    if (!socket_) return;
    if (socket_->state() != QAbstractSocket::UnconnectedState) {
        socket_->flush();
        socket_->abort();
    }
}

void TLSTransport::write(const QByteArray& data)
{
    if (isConnected()) {
        socket_->write(data);
    } else {
        qWarning() << "[TLSTransport] write DROPPED:" << data.size()
                   << "bytes (socket state:" << (socket_ ? (int)socket_->state() : -1) << ")";
    }
}

bool TLSTransport::isConnected() const
{
    return socket_ && socket_->state() == QAbstractSocket::ConnectedState
        && socket_->isEncrypted();
}

void TLSTransport::connectSocketSignals()
{
    connect(socket_, &QSslSocket::readyRead, this, [this]() {
        emit dataReceived(socket_->readAll());
    });
    // The stream is only usable once the TLS handshake is done
    connect(socket_, &QSslSocket::encrypted, this, &TLSTransport::connected);
    connect(socket_, &QSslSocket::disconnected, this, &TLSTransport::disconnected);
    connect(socket_, &QAbstractSocket::errorOccurred, this, [this](QAbstractSocket::SocketError) {
        emit error(socket_->errorString());
    });
}

} // namespace ocast
