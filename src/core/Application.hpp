/**
 * @file Application.hpp
 * @brief Process lifecycle: arguments, config, logging, event loop.
 *
 * Owns the QGuiApplication (offscreen, nothing is ever shown) and every
 * long-lived object the display loop needs. The loop itself is driven by a
 * QTimer at the configured poll interval.
 *
 * @section Dependencies
 * - Config, Logger
 * - MediaDisplayLoop
 * - QtGui, QtCore (QCommandLineParser, QTimer)
 */

#pragma once
#include <QGuiApplication>
#include <QTimer>
#include <filesystem>
#include <memory>
#include "util/Result.hpp"

namespace nd {

class MediaProvider;
class DeckRenderer;
class FavoritesLog;
class MediaDisplayLoop;

struct AppOptions {
    std::filesystem::path configPath;
    std::filesystem::path favoritesPath;
    bool debug{false};
};

class Application {
public:
    Application(int& argc, char** argv);
    ~Application();

    Result<AppOptions> parseArgs();
    Result<void> init(const AppOptions& opts);
    int exec();

    // Async-signal-safe, the timer picks it up on the next tick
    static void requestQuit();

private:
    void onTick();

    std::unique_ptr<QGuiApplication> qapp_;
    std::unique_ptr<MediaProvider> provider_;
    std::unique_ptr<DeckRenderer> renderer_;
    std::unique_ptr<FavoritesLog> favorites_;
    std::unique_ptr<MediaDisplayLoop> loop_;
    QTimer* timer_{nullptr};
};

} // namespace nd
