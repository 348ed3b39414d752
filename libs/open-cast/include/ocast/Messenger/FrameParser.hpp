#pragma once

#include <QObject>
#include <QByteArray>

namespace ocast {

// Splits the receiver byte stream into length-prefixed message bodies.
// Wire format: 4-byte big-endian body length, then the body.
class FrameParser : public QObject {
    Q_OBJECT

public:
    explicit FrameParser(QObject* parent = nullptr);

    void reset();
    int buffered() const { return m_buffer.size(); }

public slots:
    void onData(const QByteArray& data);

signals:
    void frameParsed(const QByteArray& body);
    void frameError(const QString& message);

private:
    enum class State {
        ReadLength,
        ReadBody
    };

    void process();

    State m_state = State::ReadLength;
    QByteArray m_buffer;
    quint32 m_bodyLength = 0;
};

} // namespace ocast
