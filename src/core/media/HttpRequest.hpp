#pragma once

#include <QByteArray>
#include <QHash>
#include <QString>

namespace cvn {

/// Request line and headers of one HTTP/1.x request. Header names are
/// stored lower-case.
struct HttpRequest {
    QString method;
    QString target;     // as sent, including any query string
    QString path;       // percent-decoded, query stripped
    QString version;
    QHash<QString, QString> headers;

    QString header(const QString& name) const { return headers.value(name.toLower()); }
    bool keepAlive() const;

    /// Parse the header block (everything before the blank line).
    /// Returns false on a missing or malformed request line or header.
    static bool parse(const QByteArray& head, HttpRequest& out);
};

struct ByteRange {
    qint64 start = 0;
    qint64 end = 0;     // inclusive
    qint64 length() const { return end - start + 1; }
};

enum class RangeParse {
    Valid,
    Malformed,
    Unsatisfiable
};

/// Interpret "bytes=<start>-<end>". A missing start means 0, a missing end
/// means start + chunk - 1; the end is clamped to fileSize - 1. A start past
/// the end of the file is unsatisfiable.
RangeParse parseRangeHeader(const QString& value, qint64 fileSize, qint64 chunk, ByteRange& out);

const char* httpReasonPhrase(int status);

} // namespace cvn
