#include "core/Logging.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <QtGlobal>

namespace cvn {

namespace {

void forwardQtMessage(QtMsgType type, const QMessageLogContext&, const QString& msg)
{
    const std::string text = msg.toStdString();
    switch (type) {
    case QtDebugMsg:
        BOOST_LOG_TRIVIAL(debug) << text;
        break;
    case QtInfoMsg:
        BOOST_LOG_TRIVIAL(info) << text;
        break;
    case QtWarningMsg:
        BOOST_LOG_TRIVIAL(warning) << text;
        break;
    case QtCriticalMsg:
        BOOST_LOG_TRIVIAL(error) << text;
        break;
    case QtFatalMsg:
        BOOST_LOG_TRIVIAL(fatal) << text;
        break;
    }
}

} // namespace

boost::log::trivial::severity_level parseLogLevel(const QString& name)
{
    using boost::log::trivial::severity_level;
    const QString n = name.trimmed().toLower();
    if (n == "trace") return severity_level::trace;
    if (n == "debug") return severity_level::debug;
    if (n == "warning" || n == "warn") return severity_level::warning;
    if (n == "error") return severity_level::error;
    if (n == "fatal") return severity_level::fatal;
    return severity_level::info;
}

void initLogging(const QString& level)
{
    const auto severity = parseLogLevel(level);
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= severity);
    qInstallMessageHandler(forwardQtMessage);

    BOOST_LOG_TRIVIAL(debug) << "[Logging] level " << level.toStdString();
}

} // namespace cvn
