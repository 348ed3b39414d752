#pragma once

#include <ocast/Messenger/FrameParser.hpp>
#include <ocast/Transport/ITransport.hpp>

#include <QObject>
#include <QByteArray>
#include <QJsonObject>
#include <QString>

namespace ocast {

/// Encodes and decodes CastMessage envelopes carrying JSON payloads.
/// Binary payloads are not used by the receiver and media namespaces and
/// are dropped on receipt.
class Messenger : public QObject {
    Q_OBJECT

public:
    explicit Messenger(ITransport* transport, QObject* parent = nullptr);

    void start();
    void stop();

    void send(const QString& sourceId, const QString& destinationId,
              const QString& ns, const QJsonObject& payload);

    /// Serialized CastMessage body without the length prefix.
    static QByteArray encode(const QString& sourceId, const QString& destinationId,
                             const QString& ns, const QJsonObject& payload);

signals:
    void messageReceived(const QString& sourceId, const QString& destinationId,
                         const QString& ns, const QJsonObject& payload);
    void messageSent(const QString& sourceId, const QString& destinationId,
                     const QString& ns, const QJsonObject& payload);
    void protocolError(const QString& message);

private:
    void onFrameParsed(const QByteArray& body);

    ITransport* transport_;
    FrameParser parser_;
    bool started_ = false;
};

} // namespace ocast
