#include <QTemporaryDir>
#include <QtTest>
#include <filesystem>
#include <fstream>
#include "core/FavoritesLog.hpp"

using namespace nd;
namespace fs = std::filesystem;

namespace {

std::vector<std::string> readLines(const fs::path& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line))
        lines.push_back(line);
    return lines;
}

TrackInfo track(std::string title, std::string artist) {
    TrackInfo t;
    t.title = std::move(title);
    t.artist = std::move(artist);
    return t;
}

} // namespace

class TestFavoritesLog : public QObject {
    Q_OBJECT

private slots:
    void init() {
        dir_ = std::make_unique<QTemporaryDir>();
        QVERIFY(dir_->isValid());
        path_ = fs::path(dir_->path().toStdString()) / "favorites.txt";
    }

    void testFormatLine() {
        QCOMPARE(FavoritesLog::formatLine(track("Song A", "Artist A")),
                 std::string("Song A - Artist A"));
        QCOMPARE(FavoritesLog::formatLine(track("Solo", "")),
                 std::string("Solo"));
        QCOMPARE(FavoritesLog::formatLine(track("Two\nLines", "Some\r\nOne")),
                 std::string("Two Lines - Some  One"));
    }

    void testAppendCreatesFile() {
        FavoritesLog log(path_);
        QVERIFY(log.append(track("Song A", "Artist A")).isOk());

        auto lines = readLines(path_);
        QCOMPARE(lines.size(), size_t(1));
        QCOMPARE(lines[0], std::string("Song A - Artist A"));
    }

    void testAppendKeepsPriorLines() {
        {
            std::ofstream seed(path_);
            seed << "Old One - Someone\n";
            seed << "Old Two - Someone Else\n";
        }

        FavoritesLog log(path_);
        QVERIFY(log.append(track("Song B", "Artist B")).isOk());

        auto lines = readLines(path_);
        QCOMPARE(lines.size(), size_t(3));
        QCOMPARE(lines[0], std::string("Old One - Someone"));
        QCOMPARE(lines[1], std::string("Old Two - Someone Else"));
        QCOMPARE(lines[2], std::string("Song B - Artist B"));
    }

    void testAppendCreatesParentDirectories() {
        auto nested = path_.parent_path() / "a" / "b" / "favorites.txt";
        FavoritesLog log(nested);
        QVERIFY(log.append(track("Deep", "Cut")).isOk());
        QVERIFY(fs::exists(nested));
    }

    void testIdleTrackIsRejected() {
        FavoritesLog log(path_);
        QVERIFY(log.append(TrackInfo::idle()).isErr());
        QVERIFY(!fs::exists(path_));
    }

    void testUnwritablePathFails() {
        // A directory cannot be opened for appending
        fs::create_directories(path_);
        FavoritesLog log(path_);
        auto res = log.append(track("Song", "Artist"));
        QVERIFY(res.isErr());
        QVERIFY(!res.error().message.empty());
    }

    void testResolvePathPrecedence() {
        qputenv("NOWDECK_FAVORITES", "/tmp/env-favorites.txt");
        QCOMPARE(FavoritesLog::resolvePath("/tmp/cli.txt", "/tmp/cfg.txt").string(),
                 std::string("/tmp/cli.txt"));
        QCOMPARE(FavoritesLog::resolvePath({}, "/tmp/cfg.txt").string(),
                 std::string("/tmp/env-favorites.txt"));

        qunsetenv("NOWDECK_FAVORITES");
        QCOMPARE(FavoritesLog::resolvePath({}, "/tmp/cfg.txt").string(),
                 std::string("/tmp/cfg.txt"));
        QCOMPARE(FavoritesLog::resolvePath({}, {}).filename().string(),
                 std::string("favorites.txt"));
    }

private:
    std::unique_ptr<QTemporaryDir> dir_;
    fs::path path_;
};

int runTestFavoritesLog(int argc, char** argv) {
    TestFavoritesLog tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_FavoritesLog.moc"
