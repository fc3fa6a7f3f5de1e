#include "SessionApp.hpp"
#include <csignal>
#include <cstdlib>
#include <iostream>

namespace {

session::SessionApp* g_app = nullptr;

void onShutdownSignal(int signal) {
    std::cout << "\n[main] Signal " << signal << ", stopping Session Service" << std::endl;
    if (g_app) {
        g_app->stop();
    }
}

void printBanner() {
    const char* rotation = std::getenv("AUTH_REFRESH_ROTATION");
    const char* geoHost = std::getenv("GEO_SERVICE_HOST");

    std::cout << "========================================" << std::endl;
    std::cout << "  Helix Session Service" << std::endl;
    std::cout << "  refresh rotation: " << (rotation ? rotation : "false") << std::endl;
    std::cout << "  geolocation: " << (geoHost ? geoHost : "ip-api.com") << std::endl;
    std::cout << "========================================" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    printBanner();

    try {
        session::SessionApp app;
        g_app = &app;

        std::signal(SIGINT, onShutdownSignal);
        std::signal(SIGTERM, onShutdownSignal);

        app.run(argc, argv);
        g_app = nullptr;
    } catch (const std::exception& e) {
        g_app = nullptr;
        std::cerr << "[main] Session Service failed: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    std::cout << "[main] Session Service stopped" << std::endl;
    return EXIT_SUCCESS;
}
