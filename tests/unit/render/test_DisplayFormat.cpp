#include <QtTest>
#include "render/DisplayFormat.hpp"

using namespace nd;

class TestDisplayFormat : public QObject {
    Q_OBJECT

private slots:
    void testStripNonAscii() {
        QCOMPARE(display::stripNonAscii("Beyonc\xC3\xA9 - Halo"),
                 std::string("Beyonc - Halo"));
        QCOMPARE(display::stripNonAscii("plain"), std::string("plain"));
    }

    void testShortTitleIsNotWrapped() {
        auto lines = display::wrapTitle("Short title", 65);
        QCOMPARE(lines.size(), size_t(1));
        QCOMPARE(lines[0], std::string("Short title"));
    }

    void testLongTitleWrapsAtSpace() {
        auto lines = display::wrapTitle("aaaa bbbb cccc", 10);
        QCOMPARE(lines.size(), size_t(2));
        QCOMPARE(lines[0], std::string("aaaa bbbb"));
        QCOMPARE(lines[1], std::string("cccc"));
    }

    void testLongTitleWithoutSpaceWrapsHard() {
        auto lines = display::wrapTitle("abcdefghijklmnop", 10);
        QCOMPARE(lines.size(), size_t(2));
        QCOMPARE(lines[0], std::string("abcdefghij"));
        QCOMPARE(lines[1], std::string("klmnop"));
    }

    void testHardWrapKeepsSurrogatePairWhole() {
        // U+1F600 is two UTF-16 units straddling column 10
        auto lines = display::wrapTitle("abcdefghi\xF0\x9F\x98\x80xyz", 10);
        QCOMPARE(lines.size(), size_t(2));
        QCOMPARE(lines[0], std::string("abcdefghi"));
        QCOMPARE(lines[1], std::string("\xF0\x9F\x98\x80xyz"));
    }

    void testFormatTitleArtistAlbum() {
        TrackInfo track;
        track.title = "  Song A ";
        track.artist = "Artist A";
        track.album = "Album A";
        TouchStripConfig cfg;

        QCOMPARE(display::formatText(track, cfg),
                 std::string("Song A\nArtist A\nAlbum A"));

        cfg.showAlbum = false;
        QCOMPARE(display::formatText(track, cfg),
                 std::string("Song A\nArtist A"));
    }

    void testFormatIsDeterministic() {
        TrackInfo track;
        track.title = "Same";
        track.artist = "Thing";
        TouchStripConfig cfg;
        QCOMPARE(display::formatText(track, cfg), display::formatText(track, cfg));
    }

    void testAsciiOnly() {
        TrackInfo track;
        track.title = "Caf\xC3\xA9";
        track.artist = "Ren\xC3\xA9";
        TouchStripConfig cfg;

        QCOMPARE(display::formatText(track, cfg),
                 std::string("Caf\xC3\xA9\nRen\xC3\xA9"));
        cfg.asciiOnly = true;
        QCOMPARE(display::formatText(track, cfg), std::string("Caf\nRen"));
    }

    void testNothingPlaying() {
        TouchStripConfig cfg;
        QCOMPARE(display::formatText(TrackInfo::idle(), cfg),
                 std::string("Nothing playing"));

        cfg.idleText = "-";
        auto lines = display::formatLines(TrackInfo::idle(), cfg);
        QCOMPARE(lines.size(), size_t(1));
        QCOMPARE(lines[0], std::string("-"));
    }

    void testArtistOnly() {
        TrackInfo track;
        track.artist = "Radio Station";
        TouchStripConfig cfg;
        QCOMPARE(display::formatText(track, cfg), std::string("Radio Station"));
    }
};

int runTestDisplayFormat(int argc, char** argv) {
    TestDisplayFormat tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_DisplayFormat.moc"
