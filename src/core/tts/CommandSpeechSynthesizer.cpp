#include "core/tts/CommandSpeechSynthesizer.hpp"
#include "core/notify/CancellationToken.hpp"
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QProcess>
#include <boost/log/trivial.hpp>

namespace cvn {

namespace {
constexpr int WAIT_SLICE_MS = 100;
}

CommandSpeechSynthesizer::CommandSpeechSynthesizer(const QStringList& command, int timeoutMs)
    : command_(command)
    , timeoutMs_(timeoutMs)
{
}

QStringList CommandSpeechSynthesizer::expandArguments(const QStringList& command,
                                                      const QString& text,
                                                      const QString& language,
                                                      const QString& outputPath)
{
    QStringList result;
    result.reserve(command.size());
    for (QString arg : command) {
        arg.replace("{text}", text);
        arg.replace("{lang}", language);
        arg.replace("{output}", outputPath);
        result.append(arg);
    }
    return result;
}

bool CommandSpeechSynthesizer::synthesize(const QString& text, const QString& language,
                                          const QString& outputPath,
                                          const CancellationToken& cancel, QString& error)
{
    if (command_.isEmpty()) {
        error = "no TTS command configured";
        return false;
    }

    // A leftover file from an earlier attempt must not count as output
    QFile::remove(outputPath);

    QStringList args = expandArguments(command_, text, language, outputPath);
    const QString program = args.takeFirst();

    QProcess process;
    process.setProcessChannelMode(QProcess::MergedChannels);
    process.start(program, args);
    if (!process.waitForStarted(5000)) {
        error = QString("failed to start '%1': %2").arg(program, process.errorString());
        return false;
    }

    QElapsedTimer elapsed;
    elapsed.start();
    while (!process.waitForFinished(WAIT_SLICE_MS)) {
        if (process.state() == QProcess::NotRunning)
            break;
        if (cancel.isCancelled()) {
            process.kill();
            process.waitForFinished(1000);
            error = "cancelled";
            return false;
        }
        if (elapsed.elapsed() > timeoutMs_) {
            process.kill();
            process.waitForFinished(1000);
            error = QString("'%1' timed out after %2 ms").arg(program).arg(timeoutMs_);
            return false;
        }
    }

    const QByteArray output = process.readAll().trimmed();
    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        error = QString("'%1' exited with code %2: %3")
                    .arg(program).arg(process.exitCode())
                    .arg(QString::fromUtf8(output.left(200)));
        return false;
    }

    QFileInfo info(outputPath);
    if (!info.exists() || info.size() == 0) {
        error = QString("'%1' produced no audio at %2").arg(program, outputPath);
        return false;
    }

    BOOST_LOG_TRIVIAL(debug) << "[CommandSpeechSynthesizer] " << outputPath.toStdString()
                             << " created, " << info.size() << " bytes in "
                             << elapsed.elapsed() << " ms";
    return true;
}

} // namespace cvn
