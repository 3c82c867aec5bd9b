#include <QtTest>
#include "core/Logger.hpp"

class TestLogger : public QObject {
    Q_OBJECT

private slots:
    void initTestCase() {
        // Ensure clean state
        nd::Logger::shutdown();
    }

    void testInitialization() {
        nd::Logger::init("nowdeck_test", true);
        QVERIFY(nd::Logger::get() != nullptr);
        QVERIFY(nd::Logger::get()->level() == spdlog::level::debug);

        // Should not crash
        LOG_INFO("Test info message");
        LOG_WARN("Test warn message");
        LOG_ERROR("Test error message");

        nd::Logger::shutdown();
    }

    void testDoubleInit() {
        nd::Logger::init("nowdeck_test", false);
        nd::Logger::init("nowdeck_test", false);
        QVERIFY(nd::Logger::get() != nullptr);
        QVERIFY(nd::Logger::get()->level() == spdlog::level::info);
        nd::Logger::shutdown();
    }

    void testSetDebug() {
        nd::Logger::init("nowdeck_test", false);
        nd::Logger::setDebug(true);
        QVERIFY(nd::Logger::get()->level() == spdlog::level::debug);
        nd::Logger::shutdown();
    }

    void testLazyGet() {
        // get() before init() falls back to a default logger
        QVERIFY(nd::Logger::get() != nullptr);
        LOG_DEBUG("Lazy logger message");
    }
};

int runTestLogger(int argc, char** argv) {
    TestLogger tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_Logger.moc"
