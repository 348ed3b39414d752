#pragma once

#include "core/tts/ISpeechSynthesizer.hpp"
#include <QStringList>

namespace cvn {

/// Runs an external TTS program. Arguments may contain the placeholders
/// {text}, {lang} and {output}; they are substituted per argument and the
/// program is started directly (no shell).
class CommandSpeechSynthesizer : public ISpeechSynthesizer {
public:
    CommandSpeechSynthesizer(const QStringList& command, int timeoutMs);

    bool synthesize(const QString& text, const QString& language,
                    const QString& outputPath, const CancellationToken& cancel,
                    QString& error) override;

    static QStringList expandArguments(const QStringList& command, const QString& text,
                                       const QString& language, const QString& outputPath);

private:
    QStringList command_;
    int timeoutMs_;
};

} // namespace cvn
