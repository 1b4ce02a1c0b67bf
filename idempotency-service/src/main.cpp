#include "ReaperApp.hpp"
#include <iostream>
#include <csignal>

// Global pointer for signal handler
idempotency::ReaperApp* g_app = nullptr;

void signalHandler(int) {
    if (g_app) {
        g_app->stop();
    }
}

int main(int argc, char* argv[]) {
    try {
        idempotency::ReaperApp app;
        g_app = &app;

        // Signal handlers для graceful shutdown в Kubernetes
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        std::cout << "========================================" << std::endl;
        std::cout << "  Idempotency Reaper v1.0.0 Starting" << std::endl;
        std::cout << "  Press Ctrl+C to stop" << std::endl;
        std::cout << "========================================" << std::endl;

        app.run(argc, argv);

        g_app = nullptr;
        std::cout << "[main] Idempotency Reaper stopped" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
