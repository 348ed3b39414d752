#pragma once

#include <QByteArray>

namespace ocast {

class FrameSerializer {
public:
    /// Prefix a serialized CastMessage with its 4-byte big-endian length.
    static QByteArray serialize(const QByteArray& body);
};

} // namespace ocast
