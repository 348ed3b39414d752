#include <QtTest>
#include <QElapsedTimer>
#include <QFile>
#include <QTemporaryDir>
#include "core/notify/CancellationToken.hpp"
#include "core/tts/CommandSpeechSynthesizer.hpp"

class TestCommandSynthesizer : public QObject {
    Q_OBJECT
private slots:
    void placeholdersExpandPerArgument()
    {
        const QStringList command{"espeak-ng", "-v", "{lang}", "-w", "{output}", "say: {text}"};
        const QStringList args = cvn::CommandSpeechSynthesizer::expandArguments(
            command, "dinner is ready", "fr", "/tmp/out.mp3");
        QCOMPARE(args, QStringList({"espeak-ng", "-v", "fr", "-w", "/tmp/out.mp3",
                                    "say: dinner is ready"}));
    }

    void textIsNotSplitOrShellExpanded()
    {
        const QStringList args = cvn::CommandSpeechSynthesizer::expandArguments(
            {"tts", "{text}"}, "a b; rm -rf $HOME", "en", "/x");
        QCOMPARE(args.size(), 2);
        QCOMPARE(args[1], QString("a b; rm -rf $HOME"));
    }

    void successWritesOutput()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString out = dir.filePath("kitchen.mp3");

        cvn::CommandSpeechSynthesizer tts({"/bin/sh", "-c", "printf '%s' \"$1\" > \"$2\"", "sh",
                                           "{text}", "{output}"}, 5000);
        cvn::CancellationToken cancel;
        QString error;
        QVERIFY2(tts.synthesize("hello", "en", out, cancel, error), qPrintable(error));

        QFile file(out);
        QVERIFY(file.open(QIODevice::ReadOnly));
        QCOMPARE(file.readAll(), QByteArray("hello"));
    }

    void staleOutputDoesNotCount()
    {
        QTemporaryDir dir;
        const QString out = dir.filePath("old.mp3");
        {
            QFile stale(out);
            QVERIFY(stale.open(QIODevice::WriteOnly));
            stale.write("previous run");
        }

        cvn::CommandSpeechSynthesizer tts({"/bin/sh", "-c", "true"}, 5000);
        cvn::CancellationToken cancel;
        QString error;
        QVERIFY(!tts.synthesize("hello", "en", out, cancel, error));
        QVERIFY(error.contains("produced no audio"));
        QVERIFY(!QFile::exists(out));
    }

    void emptyOutputFails()
    {
        QTemporaryDir dir;
        const QString out = dir.filePath("empty.mp3");
        cvn::CommandSpeechSynthesizer tts({"/bin/sh", "-c", ": > \"$1\"", "sh", "{output}"}, 5000);
        cvn::CancellationToken cancel;
        QString error;
        QVERIFY(!tts.synthesize("hello", "en", out, cancel, error));
        QVERIFY(error.contains("produced no audio"));
    }

    void nonZeroExitFails()
    {
        QTemporaryDir dir;
        cvn::CommandSpeechSynthesizer tts({"/bin/sh", "-c", "echo engine broke; exit 3"}, 5000);
        cvn::CancellationToken cancel;
        QString error;
        QVERIFY(!tts.synthesize("hello", "en", dir.filePath("a.mp3"), cancel, error));
        QVERIFY(error.contains("code 3"));
        QVERIFY(error.contains("engine broke"));
    }

    void missingProgramFails()
    {
        QTemporaryDir dir;
        cvn::CommandSpeechSynthesizer tts({"/nonexistent/tts-engine"}, 5000);
        cvn::CancellationToken cancel;
        QString error;
        QVERIFY(!tts.synthesize("hello", "en", dir.filePath("a.mp3"), cancel, error));
        QVERIFY(error.startsWith("failed to start"));
    }

    void emptyCommandFails()
    {
        cvn::CommandSpeechSynthesizer tts({}, 5000);
        cvn::CancellationToken cancel;
        QString error;
        QVERIFY(!tts.synthesize("hello", "en", "/tmp/unused.mp3", cancel, error));
        QVERIFY(!error.isEmpty());
    }

    void slowEngineTimesOut()
    {
        QTemporaryDir dir;
        cvn::CommandSpeechSynthesizer tts({"/bin/sh", "-c", "sleep 10"}, 300);
        cvn::CancellationToken cancel;
        QString error;
        QElapsedTimer timer;
        timer.start();
        QVERIFY(!tts.synthesize("hello", "en", dir.filePath("a.mp3"), cancel, error));
        QVERIFY(error.contains("timed out"));
        QVERIFY(timer.elapsed() < 5000);
    }

    void cancelKillsEngine()
    {
        QTemporaryDir dir;
        cvn::CommandSpeechSynthesizer tts({"/bin/sh", "-c", "sleep 10"}, 30000);
        cvn::CancellationToken cancel;
        cancel.cancel();
        QString error;
        QElapsedTimer timer;
        timer.start();
        QVERIFY(!tts.synthesize("hello", "en", dir.filePath("a.mp3"), cancel, error));
        QCOMPARE(error, QString("cancelled"));
        QVERIFY(timer.elapsed() < 5000);
    }
};

QTEST_MAIN(TestCommandSynthesizer)
#include "test_command_synthesizer.moc"
