#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QtEndian>
#include <ocast/Messenger/FrameParser.hpp>
#include <ocast/Messenger/FrameSerializer.hpp>
#include <ocast/Version.hpp>

class TestFrameParser : public QObject {
    Q_OBJECT

private slots:
    void testSerializePrefixesLength() {
        QByteArray frame = ocast::FrameSerializer::serialize(QByteArray("abc"));
        QCOMPARE(frame.size(), 7);
        QCOMPARE(qFromBigEndian<quint32>(reinterpret_cast<const uchar*>(frame.constData())),
                 quint32(3));
        QCOMPARE(frame.mid(4), QByteArray("abc"));
    }

    void testCompleteFrame() {
        ocast::FrameParser parser;
        QSignalSpy spy(&parser, &ocast::FrameParser::frameParsed);

        parser.onData(ocast::FrameSerializer::serialize("hello"));

        QCOMPARE(spy.count(), 1);
        QCOMPARE(spy[0][0].toByteArray(), QByteArray("hello"));
        QCOMPARE(parser.buffered(), 0);
    }

    void testByteByByte() {
        ocast::FrameParser parser;
        QSignalSpy spy(&parser, &ocast::FrameParser::frameParsed);

        QByteArray frame = ocast::FrameSerializer::serialize("one byte at a time");
        for (int i = 0; i < frame.size(); ++i)
            parser.onData(frame.mid(i, 1));

        QCOMPARE(spy.count(), 1);
        QCOMPARE(spy[0][0].toByteArray(), QByteArray("one byte at a time"));
    }

    void testTwoFramesOneChunk() {
        ocast::FrameParser parser;
        QSignalSpy spy(&parser, &ocast::FrameParser::frameParsed);

        parser.onData(ocast::FrameSerializer::serialize("AAAA")
                      + ocast::FrameSerializer::serialize("BBBBBB"));

        QCOMPARE(spy.count(), 2);
        QCOMPARE(spy[0][0].toByteArray(), QByteArray("AAAA"));
        QCOMPARE(spy[1][0].toByteArray(), QByteArray("BBBBBB"));
    }

    void testPartialBodyWaits() {
        ocast::FrameParser parser;
        QSignalSpy spy(&parser, &ocast::FrameParser::frameParsed);

        QByteArray frame = ocast::FrameSerializer::serialize("split-me");
        parser.onData(frame.left(6));
        QCOMPARE(spy.count(), 0);
        parser.onData(frame.mid(6));
        QCOMPARE(spy.count(), 1);
        QCOMPARE(spy[0][0].toByteArray(), QByteArray("split-me"));
    }

    void testEmptyBody() {
        ocast::FrameParser parser;
        QSignalSpy spy(&parser, &ocast::FrameParser::frameParsed);

        parser.onData(ocast::FrameSerializer::serialize(QByteArray()));

        QCOMPARE(spy.count(), 1);
        QVERIFY(spy[0][0].toByteArray().isEmpty());
    }

    void testOversizeLengthRejected() {
        ocast::FrameParser parser;
        QSignalSpy frames(&parser, &ocast::FrameParser::frameParsed);
        QSignalSpy errors(&parser, &ocast::FrameParser::frameError);

        QByteArray header(4, '\0');
        qToBigEndian<quint32>(ocast::MAX_MESSAGE_SIZE + 1,
                              reinterpret_cast<uchar*>(header.data()));
        parser.onData(header + QByteArray(16, 'x'));

        QCOMPARE(frames.count(), 0);
        QCOMPARE(errors.count(), 1);
        QCOMPARE(parser.buffered(), 0);
    }

    void testResetDropsPartialFrame() {
        ocast::FrameParser parser;
        QSignalSpy spy(&parser, &ocast::FrameParser::frameParsed);

        QByteArray stale = ocast::FrameSerializer::serialize("stale");
        parser.onData(stale.left(5));
        parser.reset();
        parser.onData(ocast::FrameSerializer::serialize("fresh"));

        QCOMPARE(spy.count(), 1);
        QCOMPARE(spy[0][0].toByteArray(), QByteArray("fresh"));
    }
};

QTEST_MAIN(TestFrameParser)
#include "test_frame_parser.moc"
