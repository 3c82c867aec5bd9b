#include <QBuffer>
#include <QImage>
#include <QtTest>
#include "render/DeckRenderer.hpp"

using namespace nd;

namespace {

QImage decode(const Bytes& jpeg) {
    QImage img;
    img.loadFromData(jpeg.data(), static_cast<int>(jpeg.size()), "JPEG");
    return img;
}

Bytes pngOf(int w, int h, Qt::GlobalColor color) {
    QImage src(w, h, QImage::Format_RGB32);
    src.fill(color);
    QByteArray data;
    QBuffer buffer(&data);
    buffer.open(QIODevice::WriteOnly);
    src.save(&buffer, "PNG");
    return Bytes(data.begin(), data.end());
}

} // namespace

class TestDeckRenderer : public QObject {
    Q_OBJECT

private slots:
    void testTouchStripMatchesRegion() {
        TouchStripConfig cfg;
        DeckRenderer renderer(cfg);

        auto jpeg = renderer.renderTouchStrip({"Song A", "Artist A"});
        QVERIFY(jpeg.isOk());

        QImage img = decode(jpeg.value());
        QVERIFY(!img.isNull());
        QCOMPARE(img.width(), 600);
        QCOMPARE(img.height(), 100);
    }

    void testTouchStripCustomRegion() {
        TouchStripConfig cfg;
        cfg.x = 0;
        cfg.width = 200;
        cfg.height = 50;
        DeckRenderer renderer(cfg);

        auto jpeg = renderer.renderTouchStrip(
                {std::string(300, 'x'), "a", "b", "c", "d", "e"});
        QVERIFY(jpeg.isOk());
        QImage img = decode(jpeg.value());
        QCOMPARE(img.size(), QSize(200, 50));
    }

    void testArtworkIsResizedToKey() {
        DeckRenderer renderer(TouchStripConfig{});

        auto art = pngOf(640, 480, Qt::red);
        auto jpeg = renderer.renderKeyArtwork(art, {120, 120});
        QVERIFY(jpeg.isOk());

        QImage img = decode(jpeg.value());
        QCOMPARE(img.size(), QSize(120, 120));
        QColor center = img.pixelColor(60, 60);
        QVERIFY(center.red() > 200);
        QVERIFY(center.green() < 60);
    }

    void testArtworkFollowsRequestedKeySize() {
        DeckRenderer renderer(TouchStripConfig{});

        auto jpeg = renderer.renderKeyArtwork(pngOf(300, 300, Qt::blue), {72, 72});
        QVERIFY(jpeg.isOk());
        QCOMPARE(decode(jpeg.value()).size(), QSize(72, 72));

        auto blank = renderer.blankKey({96, 96});
        QVERIFY(blank.isOk());
        QCOMPARE(decode(blank.value()).size(), QSize(96, 96));
    }

    void testMalformedArtworkFails() {
        DeckRenderer renderer(TouchStripConfig{});

        Bytes garbage{0x00, 0x01, 0x02, 0x03, 0xde, 0xad, 0xbe, 0xef};
        QVERIFY(renderer.renderKeyArtwork(garbage, {120, 120}).isErr());
        QVERIFY(renderer.renderKeyArtwork(Bytes{}, {120, 120}).isErr());
    }

    void testBlankKeyIsBlack() {
        DeckRenderer renderer(TouchStripConfig{});
        auto jpeg = renderer.blankKey({120, 120});
        QVERIFY(jpeg.isOk());

        QImage img = decode(jpeg.value());
        QCOMPARE(img.size(), QSize(120, 120));
        QVERIFY(img.pixelColor(10, 10).lightness() < 20);
    }
};

int runTestDeckRenderer(int argc, char** argv) {
    TestDeckRenderer tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_DeckRenderer.moc"
