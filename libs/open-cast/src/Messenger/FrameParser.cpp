#include <ocast/Messenger/FrameParser.hpp>
#include <ocast/Version.hpp>
#include <QtEndian>

namespace ocast {

FrameParser::FrameParser(QObject* parent)
    : QObject(parent)
{
}

void FrameParser::reset()
{
    m_buffer.clear();
    m_state = State::ReadLength;
    m_bodyLength = 0;
}

void FrameParser::onData(const QByteArray& data)
{
    m_buffer.append(data);
    process();
}

void FrameParser::process()
{
    while (true) {
        switch (m_state) {
        case State::ReadLength:
            if (m_buffer.size() < FRAME_LENGTH_SIZE)
                return;
            m_bodyLength = qFromBigEndian<quint32>(
                reinterpret_cast<const uchar*>(m_buffer.constData()));
            if (m_bodyLength > static_cast<quint32>(MAX_MESSAGE_SIZE)) {
                QString message = QStringLiteral("frame length %1 exceeds limit %2")
                    .arg(m_bodyLength).arg(MAX_MESSAGE_SIZE);
                reset();
                emit frameError(message);
                return;
            }
            m_buffer.remove(0, FRAME_LENGTH_SIZE);
            m_state = State::ReadBody;
            break;

        case State::ReadBody:
            if (static_cast<quint32>(m_buffer.size()) < m_bodyLength)
                return;
            {
                QByteArray body = m_buffer.left(static_cast<int>(m_bodyLength));
                m_buffer.remove(0, static_cast<int>(m_bodyLength));
                m_state = State::ReadLength;
                emit frameParsed(body);
            }
            break;
        }
    }
}

} // namespace ocast
