#include <QFile>
#include <QTemporaryDir>
#include <QUrl>
#include <QtTest>
#include "media/ArtworkLoader.hpp"
#include "media/MprisProvider.hpp"

using namespace nd;

class TestMprisProvider : public QObject {
    Q_OBJECT

private slots:
    void testMetadataMapping() {
        QVariantMap meta;
        meta["xesam:title"] = QString("  Song A ");
        meta["xesam:artist"] = QStringList{"Artist A", "Artist B"};
        meta["xesam:album"] = QString("Album A");
        meta["mpris:length"] = qlonglong(180000000);

        auto track = MprisProvider::trackFromMetadata(meta);
        QVERIFY(track.isOk());
        QCOMPARE(track.value().title, std::string("Song A"));
        QCOMPARE(track.value().artist, std::string("Artist A, Artist B"));
        QCOMPARE(track.value().album, std::string("Album A"));
        QVERIFY(!track.value().artwork.has_value());
    }

    void testArtistAsPlainString() {
        QVariantMap meta;
        meta["xesam:title"] = QString("Song");
        meta["xesam:artist"] = QString("Solo");

        auto track = MprisProvider::trackFromMetadata(meta);
        QVERIFY(track.isOk());
        QCOMPARE(track.value().artist, std::string("Solo"));
    }

    void testMissingFieldsAreEmpty() {
        auto track = MprisProvider::trackFromMetadata(QVariantMap{});
        QVERIFY(track.isOk());
        QVERIFY(track.value().isIdle());
        QVERIFY(track.value().album.empty());
    }

    void testWronglyTypedFieldsFail() {
        QVariantMap meta;
        meta["xesam:title"] = 42;
        QVERIFY(MprisProvider::trackFromMetadata(meta).isErr());

        QVariantMap badArtist;
        badArtist["xesam:title"] = QString("Song");
        badArtist["xesam:artist"] = 3.5;
        QVERIFY(MprisProvider::trackFromMetadata(badArtist).isErr());
    }

    void testFilterPlayers() {
        QStringList names{
                "org.freedesktop.Notifications",
                "org.mpris.MediaPlayer2.spotify",
                ":1.42",
                "org.mpris.MediaPlayer2.firefox.instance_1_84",
                "org.mpris.MediaPlayer2.mpv",
        };

        auto all = MprisProvider::filterPlayers(names, QString());
        QCOMPARE(all.size(), 3);
        QCOMPARE(all.first(), QString("org.mpris.MediaPlayer2.firefox.instance_1_84"));

        auto spotify = MprisProvider::filterPlayers(names, "Spotify");
        QCOMPARE(spotify, QStringList{"org.mpris.MediaPlayer2.spotify"});

        QVERIFY(MprisProvider::filterPlayers(names, "vlc").isEmpty());
    }

    void testArtworkFromFile() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        QString path = dir.filePath("cover.jpg");
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("not really a jpeg");
        file.close();

        ArtworkLoader loader(5000000, 1000);
        auto bytes = loader.load(QUrl::fromLocalFile(path).toString());
        QVERIFY(bytes.isOk());
        QCOMPARE(bytes.value().size(), size_t(17));
    }

    void testArtworkCacheKey() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        QString path = dir.filePath("cover.jpg");
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("abc");
        file.close();

        QString url = QUrl::fromLocalFile(path).toString();
        QString before = ArtworkLoader::cacheKey(url);
        QVERIFY(before.startsWith(url + "@"));

        QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Append));
        file.write("def");
        file.close();
        QVERIFY(ArtworkLoader::cacheKey(url) != before);

        QString remote = "https://example.invalid/cover.jpg";
        QCOMPARE(ArtworkLoader::cacheKey(remote), remote);
    }

    void testArtworkCacheFollowsFileChanges() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        QString path = dir.filePath("cover.jpg");
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("abc");
        file.close();

        ArtworkLoader loader(5000000, 1000);
        QString url = QUrl::fromLocalFile(path).toString();
        auto first = loader.load(url);
        QVERIFY(first.isOk());
        QCOMPARE(first.value().size(), size_t(3));

        QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
        file.write("abcdef");
        file.close();

        auto second = loader.load(url);
        QVERIFY(second.isOk());
        QCOMPARE(second.value().size(), size_t(6));
    }

    void testArtworkErrorIsCached() {
        ArtworkLoader loader(5000000, 1000);
        QVERIFY(loader.load("data:image/png;base64").isErr());
        auto again = loader.load("data:image/png;base64");
        QVERIFY(again.isErr());
        QVERIFY(!again.error().message.empty());
    }

    void testArtworkSizeLimit() {
        QTemporaryDir dir;
        QString path = dir.filePath("big.png");
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write(QByteArray(64, 'x'));
        file.close();

        ArtworkLoader loader(32, 1000);
        QVERIFY(loader.load(QUrl::fromLocalFile(path).toString()).isErr());
    }

    void testArtworkDataUri() {
        ArtworkLoader loader(5000000, 1000);
        auto bytes = loader.load("data:image/png;base64,AAEC");
        QVERIFY(bytes.isOk());
        QVERIFY((bytes.value() == Bytes{0x00, 0x01, 0x02}));

        QVERIFY(loader.load("data:image/png;base64").isErr());
    }

    void testArtworkRejectsUnknownScheme() {
        ArtworkLoader loader(5000000, 1000);
        QVERIFY(loader.load("ftp://example.invalid/cover.jpg").isErr());
        QVERIFY(loader.load(QString()).isErr());
    }
};

int runTestMprisProvider(int argc, char** argv) {
    TestMprisProvider tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_MprisProvider.moc"
