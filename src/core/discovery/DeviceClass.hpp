#pragma once

#include <QString>
#include <QStringList>

namespace cvn {

/// Model names (case-insensitive substrings) of speaker-class endpoints.
/// Anything else (TVs, dongles) is ignored for voice notifications.
const QStringList& audioModels();

bool isAudioModel(const QString& model);

} // namespace cvn
