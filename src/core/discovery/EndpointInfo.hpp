#pragma once

#include <QMetaType>
#include <QString>
#include <QtGlobal>

namespace cvn {

struct EndpointInfo {
    QString id;
    QString name;
    QString model;
    QString host;
    quint16 port = 8009;
};

} // namespace cvn

Q_DECLARE_METATYPE(cvn::EndpointInfo)
