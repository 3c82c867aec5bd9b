// main.cpp - nowdeck entry point
// Whatever is playing, on the Stream Deck+ touch strip

#include "core/Application.hpp"
#include "core/Logger.hpp"

#include <csignal>
#include <iostream>

namespace {

void onSignal(int) {
    nd::Application::requestQuit();
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        nd::Application app(argc, argv);

        std::signal(SIGINT, onSignal);
        std::signal(SIGTERM, onSignal);

        auto optsResult = app.parseArgs();
        if (!optsResult) {
            std::cerr << "Error: " << optsResult.error().message << "\n";
            std::cerr << "Try --help for usage information.\n";
            return 1;
        }

        auto opts = std::move(*optsResult);

        auto initResult = app.init(opts);
        if (!initResult) {
            std::cerr << "Initialization failed: "
                      << initResult.error().message << "\n";
            return 1;
        }

        return app.exec();

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    } catch (...) {
        std::cerr << "Unknown fatal error occurred.\n";
        return 1;
    }
}
