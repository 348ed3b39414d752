#pragma once

#include <QString>
#include <boost/log/trivial.hpp>

namespace cvn {

/// Map a level name (trace, debug, info, warning, error, fatal) to a Boost.Log
/// severity. Unknown names map to info.
boost::log::trivial::severity_level parseLogLevel(const QString& name);

/// Apply the severity filter to the Boost.Log core and route Qt's qDebug/qInfo/
/// qWarning output through Boost.Log so both share the same sink and filter.
void initLogging(const QString& level);

} // namespace cvn
