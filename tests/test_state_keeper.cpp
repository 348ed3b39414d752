#include <QtTest>
#include "core/notify/CancellationToken.hpp"
#include "core/notify/StateKeeper.hpp"
#include "fakes/FakeTarget.hpp"

namespace {
cvn::StateKeeper::Config fastConfig()
{
    cvn::StateKeeper::Config c;
    c.notificationVolume = 0.5;
    c.readyAttempts = 5;
    c.readyIntervalSeconds = 0.01;
    return c;
}

cvn::TargetStatus status(double volume, bool muted, const QString& app = QString())
{
    cvn::TargetStatus s;
    s.hasVolume = true;
    s.volumeLevel = volume;
    s.hasMuted = true;
    s.muted = muted;
    s.runningAppId = app;
    return s;
}
}

class TestStateKeeper : public QObject {
    Q_OBJECT
private slots:
    void snapshotCapturesAndPreparesTarget()
    {
        FakeTarget target("kitchen", "Kitchen");
        target.setStatus(status(0.3, false, "CC32E753"));
        cvn::StateKeeper keeper(fastConfig());

        auto snap = keeper.snapshot(target);
        QVERIFY(!snap.isEmpty());
        QVERIFY(snap.hasVolume);
        QCOMPARE(snap.volumeLevel, 0.3);
        QVERIFY(snap.hasMuted);
        QVERIFY(!snap.muted);
        QCOMPARE(snap.runningApp, QString("CC32E753"));

        QCOMPARE(target.stopAppCalls(), 1);
        QCOMPARE(target.volumeCalls(), QList<double>({0.5}));
        QCOMPARE(target.mutedCalls(), QList<bool>({false}));
    }

    void restoreReappliesExactState()
    {
        FakeTarget target("kitchen", "Kitchen");
        target.setStatus(status(0.72, false));
        cvn::StateKeeper keeper(fastConfig());
        cvn::CancellationToken cancel;

        auto snap = keeper.snapshot(target);
        QCOMPARE(target.currentStatus().volumeLevel, 0.5);

        QCOMPARE(keeper.restore(target, snap, cancel), cvn::RestoreResult::Restored);
        QCOMPARE(target.currentStatus().volumeLevel, 0.72);
        QVERIFY(!target.currentStatus().muted);
        QCOMPARE(target.stopAppCalls(), 2);
    }

    void restoreReappliesMute()
    {
        FakeTarget target("kitchen", "Kitchen");
        target.setStatus(status(0.2, true));
        cvn::StateKeeper keeper(fastConfig());
        cvn::CancellationToken cancel;

        auto snap = keeper.snapshot(target);
        QVERIFY(!target.currentStatus().muted);
        QCOMPARE(keeper.restore(target, snap, cancel), cvn::RestoreResult::Restored);
        QVERIFY(target.currentStatus().muted);
        QCOMPARE(target.currentStatus().volumeLevel, 0.2);
    }

    void emptySnapshotIsNoOp()
    {
        FakeTarget target("kitchen", "Kitchen");
        target.clearStatus();
        cvn::StateKeeper keeper(fastConfig());
        cvn::CancellationToken cancel;

        auto snap = keeper.snapshot(target);
        QVERIFY(snap.isEmpty());
        const int stops = target.stopAppCalls();
        const int volumes = target.volumeCalls().size();

        QCOMPARE(keeper.restore(target, snap, cancel), cvn::RestoreResult::Skipped);
        QCOMPARE(target.stopAppCalls(), stops);
        QCOMPARE(target.volumeCalls().size(), volumes);
    }

    void restoreWaitsForReconnect()
    {
        FakeTarget target("kitchen", "Kitchen");
        target.setStatus(status(0.4, false));
        target.setReconnectAfterStop(3);
        cvn::StateKeeper keeper(fastConfig());
        cvn::CancellationToken cancel;

        auto snap = keeper.snapshot(target);
        QCOMPARE(keeper.restore(target, snap, cancel), cvn::RestoreResult::Restored);
        QCOMPARE(target.volumeCalls().last(), 0.4);
    }

    void restoreTimesOutWithoutPartialRestore()
    {
        FakeTarget target("kitchen", "Kitchen");
        target.setStatus(status(0.4, false));
        cvn::StateKeeper keeper(fastConfig());
        cvn::CancellationToken cancel;

        auto snap = keeper.snapshot(target);
        target.setReady(false);
        QCOMPARE(keeper.restore(target, snap, cancel), cvn::RestoreResult::Timeout);
        // Only the notification volume from the snapshot step was applied
        QCOMPARE(target.volumeCalls(), QList<double>({0.5}));
        QCOMPARE(target.stopAppCalls(), 1);
    }

    void restoreStopsWhenCancelled()
    {
        FakeTarget target("kitchen", "Kitchen");
        target.setStatus(status(0.4, false));
        cvn::StateKeeper::Config config = fastConfig();
        config.readyIntervalSeconds = 30.0;
        cvn::StateKeeper keeper(config);
        cvn::CancellationToken cancel;

        auto snap = keeper.snapshot(target);
        target.setReady(false);
        cancel.cancel();

        QElapsedTimer clock;
        clock.start();
        QCOMPARE(keeper.restore(target, snap, cancel), cvn::RestoreResult::Cancelled);
        QVERIFY(clock.elapsed() < 5000);
    }

    void readyTargetRestoresEvenWhenCancelled()
    {
        FakeTarget target("kitchen", "Kitchen");
        target.setStatus(status(0.4, false));
        cvn::StateKeeper keeper(fastConfig());
        cvn::CancellationToken cancel;

        auto snap = keeper.snapshot(target);
        cancel.cancel();
        QCOMPARE(keeper.restore(target, snap, cancel), cvn::RestoreResult::Restored);
        QCOMPARE(target.currentStatus().volumeLevel, 0.4);
    }
};

QTEST_MAIN(TestStateKeeper)
#include "test_state_keeper.moc"
