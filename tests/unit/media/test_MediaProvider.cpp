#include <QtTest>
#include "media/MediaProvider.hpp"

using namespace nd;

class TestMediaProvider : public QObject {
    Q_OBJECT

private slots:
    void testPlayingWinsOverEarlierPaused() {
        auto index = selectSession({PlaybackStatus::Paused, PlaybackStatus::Stopped,
                                    PlaybackStatus::Playing, PlaybackStatus::Playing});
        QVERIFY(index.has_value());
        QCOMPARE(*index, usize(2));
    }

    void testFirstPausedWhenNothingPlays() {
        auto index = selectSession({PlaybackStatus::Stopped, PlaybackStatus::Paused,
                                    PlaybackStatus::Paused});
        QVERIFY(index.has_value());
        QCOMPARE(*index, usize(1));
    }

    void testNoSessionWhenAllStopped() {
        QVERIFY(!selectSession({PlaybackStatus::Stopped}).has_value());
        QVERIFY(!selectSession({}).has_value());
    }

    void testPlayerFilter() {
        QVERIFY(matchesPlayerFilter("org.mpris.MediaPlayer2.spotify", ""));
        QVERIFY(matchesPlayerFilter("org.mpris.MediaPlayer2.spotify", "Spotify"));
        QVERIFY(matchesPlayerFilter("Spotify.exe", "spotify"));
        QVERIFY(!matchesPlayerFilter("org.mpris.MediaPlayer2.vlc", "spotify"));
        QVERIFY(!matchesPlayerFilter("", "vlc"));
    }
};

int runTestMediaProvider(int argc, char** argv) {
    TestMediaProvider tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_MediaProvider.moc"
