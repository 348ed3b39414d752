#include <ocast/Messenger/Messenger.hpp>
#include <ocast/Messenger/FrameSerializer.hpp>
#include <QJsonDocument>
#include <QDebug>

#include "cast_channel.pb.h"

namespace ocast {

Messenger::Messenger(ITransport* transport, QObject* parent)
    : QObject(parent)
    , transport_(transport)
    , parser_(this)
{
    connect(&parser_, &FrameParser::frameParsed,
            this, &Messenger::onFrameParsed);
    connect(&parser_, &FrameParser::frameError,
            this, &Messenger::protocolError);
}

void Messenger::start()
{
    if (started_) return;
    parser_.reset();
    connect(transport_, &ITransport::dataReceived,
            &parser_, &FrameParser::onData);
    started_ = true;
}

void Messenger::stop()
{
    if (!started_) return;
    disconnect(transport_, &ITransport::dataReceived,
               &parser_, &FrameParser::onData);
    parser_.reset();
    started_ = false;
}

QByteArray Messenger::encode(const QString& sourceId, const QString& destinationId,
                             const QString& ns, const QJsonObject& payload)
{
    proto::CastMessage message;
    message.set_protocol_version(proto::CastMessage::CASTV2_1_0);
    message.set_source_id(sourceId.toStdString());
    message.set_destination_id(destinationId.toStdString());
    message.set_namespace_(ns.toStdString());
    message.set_payload_type(proto::CastMessage::STRING);
    message.set_payload_utf8(
        QJsonDocument(payload).toJson(QJsonDocument::Compact).toStdString());

    QByteArray body(static_cast<int>(message.ByteSizeLong()), '\0');
    message.SerializeToArray(body.data(), body.size());
    return body;
}

void Messenger::send(const QString& sourceId, const QString& destinationId,
                     const QString& ns, const QJsonObject& payload)
{
    transport_->write(FrameSerializer::serialize(
        encode(sourceId, destinationId, ns, payload)));
    emit messageSent(sourceId, destinationId, ns, payload);
}

void Messenger::onFrameParsed(const QByteArray& body)
{
    proto::CastMessage message;
    if (!message.ParseFromArray(body.constData(), body.size())) {
        emit protocolError(QStringLiteral("undecodable CastMessage (%1 bytes)").arg(body.size()));
        return;
    }

    const QString ns = QString::fromStdString(message.namespace_());
    if (message.payload_type() != proto::CastMessage::STRING) {
        qDebug() << "[Messenger] ignoring binary payload on" << ns;
        return;
    }

    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(
        QByteArray::fromStdString(message.payload_utf8()), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        emit protocolError(QStringLiteral("invalid JSON payload on %1: %2")
                               .arg(ns, err.errorString()));
        return;
    }

    emit messageReceived(QString::fromStdString(message.source_id()),
                         QString::fromStdString(message.destination_id()),
                         ns, doc.object());
}

} // namespace ocast
