#include <QtTest>
#include <QElapsedTimer>
#include <QThread>
#include <memory>
#include "core/notify/CancellationToken.hpp"
#include "core/notify/PlaybackCompletionDetector.hpp"
#include "fakes/FakeTarget.hpp"

namespace {
cvn::DetectorConfig fastConfig()
{
    cvn::DetectorConfig c;
    c.bitrateBps = 64000;
    c.activeTimeoutSeconds = 0.2;
    c.settleSeconds = 0.02;
    c.pollIntervalSeconds = 0.02;
    c.flushGraceSeconds = 0.01;
    c.minTimeoutSeconds = 0.5;
    c.estimateMarginSeconds = 0.0;
    c.durationMarginSeconds = 0.2;
    return c;
}
}

class TestCompletionDetector : public QObject {
    Q_OBJECT
private slots:
    void estimatesDurationFromBitrate()
    {
        cvn::PlaybackCompletionDetector detector(fastConfig());
        QCOMPARE(detector.estimateDurationSeconds(16000), 2.0);
        QCOMPARE(detector.estimateDurationSeconds(0), 0.0);
    }

    void awaitActiveSucceeds()
    {
        FakeTarget target("k", "Kitchen");
        target.play("http://h/k.mp3", "audio/mpeg");
        cvn::PlaybackCompletionDetector detector(fastConfig());
        cvn::CancellationToken cancel;
        QVERIFY(detector.awaitActive(target, cancel));
    }

    void awaitActiveTimesOut()
    {
        FakeTarget target("k", "Kitchen");
        target.setActivateOnPlay(false);
        target.play("http://h/k.mp3", "audio/mpeg");
        cvn::PlaybackCompletionDetector detector(fastConfig());
        cvn::CancellationToken cancel;

        QElapsedTimer clock;
        clock.start();
        QVERIFY(!detector.awaitActive(target, cancel));
        QVERIFY(clock.elapsed() >= 150);
        QVERIFY(clock.elapsed() < 3000);
    }

    void completesWhenIdleFollowsPlaying()
    {
        FakeTarget target("k", "Kitchen");
        target.setPlayingPolls(3);
        target.play("http://h/k.mp3", "audio/mpeg");
        cvn::PlaybackCompletionDetector detector(fastConfig());
        cvn::CancellationToken cancel;

        auto result = detector.detect(target, 0.1, cancel);
        QVERIFY(result.completed);
        QVERIFY(result.sawPlaying);
        QVERIFY(!result.cancelled);
        QCOMPARE(result.polls, 4);
        QVERIFY(result.elapsedSeconds < 0.5);
        QVERIFY(target.statusRequests() >= 4);
    }

    void neverCompletesWithoutPlaying()
    {
        FakeTarget target("k", "Kitchen");
        target.setPlayingPolls(0);
        target.play("http://h/k.mp3", "audio/mpeg");
        cvn::PlaybackCompletionDetector detector(fastConfig());
        cvn::CancellationToken cancel;

        // Idle the whole time: must run into max(min timeout, estimate + margin)
        auto result = detector.detect(target, 0.1, cancel);
        QVERIFY(!result.completed);
        QVERIFY(!result.sawPlaying);
        QVERIFY(result.elapsedSeconds >= 0.5);
        QVERIFY(result.elapsedSeconds < 3.0);
    }

    void estimateExtendsDeadline()
    {
        FakeTarget target("k", "Kitchen");
        target.setPlayingPolls(0);
        target.play("http://h/k.mp3", "audio/mpeg");
        cvn::PlaybackCompletionDetector detector(fastConfig());
        cvn::CancellationToken cancel;

        auto result = detector.detect(target, 1.0, cancel);
        QVERIFY(!result.completed);
        QVERIFY(result.elapsedSeconds >= 1.0);
    }

    void endlessPlaybackTimesOut()
    {
        FakeTarget target("k", "Kitchen");
        target.setPlayingPolls(-1);
        target.play("http://h/k.mp3", "audio/mpeg");
        cvn::PlaybackCompletionDetector detector(fastConfig());
        cvn::CancellationToken cancel;

        auto result = detector.detect(target, 0.1, cancel);
        QVERIFY(!result.completed);
        QVERIFY(result.sawPlaying);
        QVERIFY(!result.durationKnown);
    }

    void reportedDurationResetsDeadline()
    {
        cvn::DetectorConfig config = fastConfig();
        config.minTimeoutSeconds = 30.0;
        FakeTarget target("k", "Kitchen");
        target.setPlayingPolls(-1);
        target.setDuration(0.3);
        target.play("http://h/k.mp3", "audio/mpeg");
        cvn::PlaybackCompletionDetector detector(config);
        cvn::CancellationToken cancel;

        // Deadline becomes first-playing + 0.3 s + 0.2 s margin instead of 30 s
        auto result = detector.detect(target, 0.1, cancel);
        QVERIFY(!result.completed);
        QVERIFY(result.durationKnown);
        QVERIFY(result.elapsedSeconds < 5.0);
    }

    void cancellationStopsPolling()
    {
        cvn::DetectorConfig config = fastConfig();
        config.minTimeoutSeconds = 30.0;
        config.flushGraceSeconds = 30.0;
        FakeTarget target("k", "Kitchen");
        target.setPlayingPolls(-1);
        target.play("http://h/k.mp3", "audio/mpeg");
        cvn::PlaybackCompletionDetector detector(config);
        cvn::CancellationToken cancel;

        std::unique_ptr<QThread> canceller(QThread::create([&cancel]() {
            QThread::msleep(100);
            cancel.cancel();
        }));
        canceller->start();

        auto result = detector.detect(target, 0.1, cancel);
        QVERIFY(canceller->wait(5000));
        QVERIFY(result.cancelled);
        QVERIFY(!result.completed);
        QVERIFY(result.elapsedSeconds < 5.0);
    }
};

QTEST_MAIN(TestCompletionDetector)
#include "test_completion_detector.moc"
