#pragma once

#include <ocast/Transport/ITransport.hpp>
#include <QSslSocket>

namespace ocast {

// TLS byte stream to a Cast receiver. Receivers present self-signed
// certificates, so peer verification is off.
class TLSTransport : public ITransport {
    Q_OBJECT
public:
    TLSTransport(const QString& host, quint16 port, QObject* parent = nullptr);
    ~TLSTransport() override;

    void start() override;
    void stop() override;
    void write(const QByteArray& data) override;
    bool isConnected() const override;

    QString host() const { return host_; }
    quint16 port() const { return port_; }

private:
    void connectSocketSignals();

    QString host_;
    quint16 port_;
    QSslSocket* socket_ = nullptr;
};

} // namespace ocast
