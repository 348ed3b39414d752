#include "core/media/HttpRequest.hpp"
#include <QStringList>
#include <QUrl>

namespace cvn {

bool HttpRequest::keepAlive() const
{
    const QString connection = header("connection").toLower();
    if (version == QLatin1String("HTTP/1.0"))
        return connection == QLatin1String("keep-alive");
    return connection != QLatin1String("close");
}

bool HttpRequest::parse(const QByteArray& head, HttpRequest& out)
{
    out = HttpRequest{};

    const QList<QByteArray> lines = head.split('\n');
    if (lines.isEmpty())
        return false;

    const QString requestLine = QString::fromLatin1(lines.first()).trimmed();
    const QStringList parts = requestLine.split(' ', Qt::SkipEmptyParts);
    if (parts.size() != 3)
        return false;

    out.method = parts[0];
    out.target = parts[1];
    out.version = parts[2];
    if (!out.version.startsWith(QLatin1String("HTTP/1.")) || !out.target.startsWith('/'))
        return false;

    for (int i = 1; i < lines.size(); ++i) {
        const QString line = QString::fromLatin1(lines[i]).trimmed();
        if (line.isEmpty())
            continue;
        const int colon = line.indexOf(':');
        if (colon <= 0)
            return false;
        out.headers.insert(line.left(colon).trimmed().toLower(), line.mid(colon + 1).trimmed());
    }

    // HTTP/1.1 clients must identify the host
    if (out.version == QLatin1String("HTTP/1.1") && !out.headers.contains("host"))
        return false;

    QString rawPath = out.target;
    const int query = rawPath.indexOf('?');
    if (query >= 0)
        rawPath.truncate(query);
    out.path = QUrl::fromPercentEncoding(rawPath.toUtf8());
    return true;
}

RangeParse parseRangeHeader(const QString& value, qint64 fileSize, qint64 chunk, ByteRange& out)
{
    QString byteSpec = value.trimmed();
    if (!byteSpec.startsWith(QLatin1String("bytes="), Qt::CaseInsensitive))
        return RangeParse::Malformed;
    byteSpec = byteSpec.mid(6).trimmed();

    // Multiple ranges are not supported
    if (byteSpec.contains(','))
        return RangeParse::Malformed;

    const int dash = byteSpec.indexOf('-');
    if (dash < 0)
        return RangeParse::Malformed;

    const QString startStr = byteSpec.left(dash).trimmed();
    const QString endStr = byteSpec.mid(dash + 1).trimmed();

    bool ok = true;
    qint64 start = startStr.isEmpty() ? 0 : startStr.toLongLong(&ok);
    if (!ok || start < 0)
        return RangeParse::Malformed;

    qint64 end = 0;
    if (!endStr.isEmpty()) {
        end = endStr.toLongLong(&ok);
        if (!ok || end < 0)
            return RangeParse::Malformed;
    }

    if (fileSize <= 0 || start > fileSize - 1)
        return RangeParse::Unsatisfiable;

    // start + chunk can overflow for starts near INT64_MAX; stay below fileSize
    if (endStr.isEmpty())
        end = start + qMin<qint64>(chunk - 1, fileSize - 1 - start);
    else
        end = qMin(end, fileSize - 1);
    if (end < start)
        return RangeParse::Unsatisfiable;

    out.start = start;
    out.end = end;
    return RangeParse::Valid;
}

const char* httpReasonPhrase(int status)
{
    switch (status) {
    case 200: return "OK";
    case 206: return "Partial Content";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 416: return "Range Not Satisfiable";
    case 500: return "Internal Server Error";
    default: return "Unknown";
    }
}

} // namespace cvn
