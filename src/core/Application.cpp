#include "Application.hpp"
#include <QCommandLineParser>
#include <atomic>
#include <utility>
#include "Config.hpp"
#include "FavoritesLog.hpp"
#include "Logger.hpp"
#include "app/MediaDisplayLoop.hpp"
#include "device/DeviceManager.hpp"
#include "media/MediaProvider.hpp"
#include "render/DeckRenderer.hpp"

namespace nd {

namespace {

std::atomic<bool> g_quitRequested{false};

} // namespace

Application::Application(int& argc, char** argv) {
    // Rendering only needs QImage/QPainter, never a display server
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM"))
        qputenv("QT_QPA_PLATFORM", "offscreen");

    QCoreApplication::setApplicationName("nowdeck");
    QCoreApplication::setApplicationVersion(NOWDECK_VERSION);
    qapp_ = std::make_unique<QGuiApplication>(argc, argv);
}

Application::~Application() {
    loop_.reset();
    Logger::shutdown();
}

void Application::requestQuit() {
    g_quitRequested = true;
}

Result<AppOptions> Application::parseArgs() {
    QCommandLineParser parser;
    parser.setApplicationDescription(
            "Shows the current media session on a Stream Deck+");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOpt({"c", "config"},
                                 "Configuration file to load.",
                                 "file");
    QCommandLineOption favoritesOpt({"f", "favorites"},
                                    "Favorites log file (overrides config and "
                                    "NOWDECK_FAVORITES).",
                                    "file");
    QCommandLineOption debugOpt({"d", "debug"}, "Enable debug logging.");
    parser.addOption(configOpt);
    parser.addOption(favoritesOpt);
    parser.addOption(debugOpt);

    // showHelp()/showVersion() exit the process
    if (!parser.parse(QCoreApplication::arguments()))
        return Result<AppOptions>::err(parser.errorText().toStdString());
    if (parser.isSet("help"))
        parser.showHelp(0);
    if (parser.isSet("version"))
        parser.showVersion();
    if (!parser.positionalArguments().isEmpty())
        return Result<AppOptions>::err(
                "Unexpected argument: " +
                parser.positionalArguments().first().toStdString());

    AppOptions opts;
    opts.configPath = parser.value(configOpt).toStdString();
    opts.favoritesPath = parser.value(favoritesOpt).toStdString();
    opts.debug = parser.isSet(debugOpt);
    return Result<AppOptions>::ok(std::move(opts));
}

Result<void> Application::init(const AppOptions& opts) {
    Logger::init("nowdeck", opts.debug);

    auto loaded = opts.configPath.empty() ? CONFIG.loadDefault()
                                          : CONFIG.load(opts.configPath);
    if (!loaded)
        return loaded;

    const auto& cfg = std::as_const(CONFIG);
    if (cfg.general().debug && !opts.debug)
        Logger::setDebug(true);

    auto favoritesPath =
            FavoritesLog::resolvePath(opts.favoritesPath, cfg.favorites().path);
    LOG_INFO("Favorites log: {}", favoritesPath.string());

    provider_ = createMediaProvider(cfg.media());
    renderer_ = std::make_unique<DeckRenderer>(cfg.touchStrip());
    favorites_ = std::make_unique<FavoritesLog>(favoritesPath);

    const DeviceConfig deviceCfg = cfg.device();
    LoopSettings settings;
    settings.keys = cfg.keys();
    settings.reconnectInterval = Duration(deviceCfg.scanIntervalMs);

    loop_ = std::make_unique<MediaDisplayLoop>(
            *provider_,
            *renderer_,
            *favorites_,
            [deviceCfg]() { return DeviceManager::open(deviceCfg); },
            settings);

    loop_->connectionChanged.connect([](bool connected) {
        if (!connected)
            LOG_INFO("No stream Deck Detected...");
    });

    auto device = DeviceManager::open(deviceCfg);
    if (device && !loop_->attach(std::move(device).value()))
        device = Result<std::unique_ptr<DeckDevice>>::err(
                "Stream Deck does not fit the configured layout");
    if (!device) {
        if (!deviceCfg.waitForDevice)
            return Result<void>::err("Device initialization failed: " +
                                     device.error().message);
        LOG_INFO("No stream Deck Detected... ({}), will keep scanning",
                 device.error().message);
    }

    timer_ = new QTimer(qapp_.get());
    timer_->setInterval(static_cast<int>(cfg.general().pollIntervalMs));
    QObject::connect(
            timer_, &QTimer::timeout, qapp_.get(), [this]() { onTick(); });

    LOG_INFO("Polling media every {} ms", cfg.general().pollIntervalMs);
    return Result<void>::ok();
}

void Application::onTick() {
    if (g_quitRequested) {
        LOG_INFO("Shutting down");
        timer_->stop();
        QCoreApplication::quit();
        return;
    }
    loop_->tick();
}

int Application::exec() {
    timer_->start();
    loop_->tick();
    return qapp_->exec();
}

} // namespace nd
