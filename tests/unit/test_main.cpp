/**
 * @file test_main.cpp
 * @brief Test suite entry point using Qt Test.
 */
#include <QGuiApplication>
#include <QStandardPaths>
#include <QtTest>

int runTestLogger(int argc, char** argv);
int runTestConfigParsers(int argc, char** argv);
int runTestFavoritesLog(int argc, char** argv);
int runTestDisplayFormat(int argc, char** argv);
int runTestDeckRenderer(int argc, char** argv);
int runTestStreamDeckPlus(int argc, char** argv);
int runTestMediaProvider(int argc, char** argv);
int runTestMediaDisplayLoop(int argc, char** argv);
#ifdef NOWDECK_HAVE_MPRIS
int runTestHidrawTransport(int argc, char** argv);
int runTestMprisProvider(int argc, char** argv);
#endif

int main(int argc, char* argv[]) {
    // QPainter text needs a platform plugin, never a real display
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM"))
        qputenv("QT_QPA_PLATFORM", "offscreen");

    QCoreApplication::setApplicationName("nowdeck_tests");
    QStandardPaths::setTestModeEnabled(true);
    QGuiApplication app(argc, argv);

    int status = 0;
    status |= runTestLogger(argc, argv);
    status |= runTestConfigParsers(argc, argv);
    status |= runTestFavoritesLog(argc, argv);
    status |= runTestDisplayFormat(argc, argv);
    status |= runTestDeckRenderer(argc, argv);
    status |= runTestStreamDeckPlus(argc, argv);
    status |= runTestMediaProvider(argc, argv);
    status |= runTestMediaDisplayLoop(argc, argv);
#ifdef NOWDECK_HAVE_MPRIS
    status |= runTestHidrawTransport(argc, argv);
    status |= runTestMprisProvider(argc, argv);
#endif

    return status;
}
