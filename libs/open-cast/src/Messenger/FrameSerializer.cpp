#include <ocast/Messenger/FrameSerializer.hpp>
#include <ocast/Version.hpp>
#include <QtEndian>

namespace ocast {

QByteArray FrameSerializer::serialize(const QByteArray& body)
{
    QByteArray frame;
    frame.reserve(FRAME_LENGTH_SIZE + body.size());

    quint32 lengthBE = qToBigEndian(static_cast<quint32>(body.size()));
    frame.append(reinterpret_cast<const char*>(&lengthBE), FRAME_LENGTH_SIZE);
    frame.append(body);
    return frame;
}

} // namespace ocast
