#pragma once

#include <QString>

namespace cvn {

class CancellationToken;

class ISpeechSynthesizer {
public:
    virtual ~ISpeechSynthesizer() = default;

    /// Render text to an audio file at outputPath. Blocks the caller.
    /// Returns false and fills error on engine failure, cancellation, or
    /// when no (or an empty) file was produced.
    virtual bool synthesize(const QString& text, const QString& language,
                            const QString& outputPath, const CancellationToken& cancel,
                            QString& error) = 0;
};

} // namespace cvn
