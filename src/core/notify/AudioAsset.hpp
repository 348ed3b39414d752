#pragma once

#include <QString>
#include <QtGlobal>

namespace cvn {

/// A synthesized speech file waiting to be fetched by a target.
/// Named <targetId>.mp3 inside the asset directory, so a newer notification
/// for the same target overwrites a stale file.
struct AudioAsset {
    QString path;
    QString fileName;
    qint64 sizeBytes = 0;
    double estimatedDurationSeconds = 0.0;

    static QString fileNameFor(const QString& targetId)
    {
        QString safe = targetId;
        for (QChar& c : safe) {
            if (!c.isLetterOrNumber() && c != '-' && c != '_')
                c = '_';
        }
        return safe + ".mp3";
    }

    /// Size-based duration estimate for a constant-bitrate stream.
    static double estimateDuration(qint64 sizeBytes, int bitrateBps)
    {
        if (bitrateBps <= 0) return 0.0;
        return static_cast<double>(sizeBytes) * 8.0 / bitrateBps;
    }
};

} // namespace cvn
