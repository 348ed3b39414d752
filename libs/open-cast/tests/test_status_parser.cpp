#include <QtTest/QtTest>
#include <QJsonDocument>
#include <ocast/Status/StatusParser.hpp>

class TestStatusParser : public QObject {
    Q_OBJECT

private:
    QJsonObject json(const char* text) {
        return QJsonDocument::fromJson(QByteArray(text)).object();
    }

private slots:
    void testReceiverStatusWithApplication() {
        ocast::ReceiverStatus status;
        QVERIFY(ocast::StatusParser::parseReceiverStatus(json(R"({
            "type": "RECEIVER_STATUS",
            "status": {
                "applications": [{
                    "appId": "CC1AD845",
                    "displayName": "Default Media Receiver",
                    "sessionId": "abc-123",
                    "transportId": "web-5",
                    "isIdleScreen": false
                }],
                "volume": {"level": 0.35, "muted": true}
            }
        })"), status));

        QVERIFY(status.hasVolume);
        QCOMPARE(status.volumeLevel, 0.35);
        QVERIFY(status.muted);
        QVERIFY(status.hasApplication());
        QCOMPARE(status.appId, QString("CC1AD845"));
        QCOMPARE(status.sessionId, QString("abc-123"));
        QCOMPARE(status.transportId, QString("web-5"));
        QVERIFY(!status.isIdleScreen);
    }

    void testReceiverStatusIdle() {
        ocast::ReceiverStatus status;
        QVERIFY(ocast::StatusParser::parseReceiverStatus(json(R"({
            "status": {"volume": {"level": 1.0, "muted": false}}
        })"), status));

        QVERIFY(!status.hasApplication());
        QCOMPARE(status.volumeLevel, 1.0);
        QVERIFY(!status.muted);
    }

    void testBackdropCountsAsIdleScreen() {
        ocast::ReceiverStatus status;
        QVERIFY(ocast::StatusParser::parseReceiverStatus(json(R"({
            "status": {"applications": [{"appId": "E8C28D3C", "sessionId": "s"}]}
        })"), status));
        QVERIFY(status.isIdleScreen);
        QVERIFY(!status.hasVolume);
    }

    void testReceiverStatusMissingObject() {
        ocast::ReceiverStatus status;
        QVERIFY(!ocast::StatusParser::parseReceiverStatus(json(R"({"type": "RECEIVER_STATUS"})"),
                                                          status));
    }

    void testMediaStatusPlaying() {
        ocast::MediaStatus status;
        QVERIFY(ocast::StatusParser::parseMediaStatus(json(R"({
            "type": "MEDIA_STATUS",
            "status": [{
                "mediaSessionId": 3,
                "playerState": "PLAYING",
                "currentTime": 1.25,
                "supportedMediaCommands": 15,
                "media": {"duration": 4.5}
            }]
        })"), status));

        QCOMPARE(status.mediaSessionId, 3);
        QVERIFY(status.isPlaying());
        QVERIFY(status.hasCurrentTime);
        QCOMPARE(status.currentTime, 1.25);
        QVERIFY(status.hasDuration);
        QCOMPARE(status.duration, 4.5);
        QVERIFY(status.supportsSeek);
    }

    void testMediaStatusEmptyArrayIsIdle() {
        ocast::MediaStatus status;
        QVERIFY(ocast::StatusParser::parseMediaStatus(json(R"({"status": []})"), status));
        QVERIFY(status.isIdle());
        QCOMPARE(status.mediaSessionId, 0);
        QVERIFY(!status.hasDuration);
    }

    void testZeroDurationIsUnknown() {
        ocast::MediaStatus status;
        QVERIFY(ocast::StatusParser::parseMediaStatus(json(R"({
            "status": [{"mediaSessionId": 1, "playerState": "BUFFERING",
                        "supportedMediaCommands": 1, "media": {"duration": 0}}]
        })"), status));
        QCOMPARE(status.playerState, ocast::PlayerState::Buffering);
        QVERIFY(!status.hasDuration);
        QVERIFY(!status.hasCurrentTime);
        QVERIFY(!status.supportsSeek);
    }

    void testIdleReason() {
        ocast::MediaStatus status;
        QVERIFY(ocast::StatusParser::parseMediaStatus(json(R"({
            "status": [{"mediaSessionId": 1, "playerState": "IDLE", "idleReason": "FINISHED"}]
        })"), status));
        QVERIFY(status.isIdle());
        QCOMPARE(status.idleReason, QString("FINISHED"));
    }

    void testUnknownPlayerState() {
        QCOMPARE(ocast::StatusParser::parsePlayerState("SPINNING"), ocast::PlayerState::Unknown);
        QCOMPARE(QString(ocast::playerStateName(ocast::PlayerState::Paused)), QString("PAUSED"));
    }
};

QTEST_MAIN(TestStatusParser)
#include "test_status_parser.moc"
