#include "InventoryApp.hpp"
#include <csignal>
#include <iostream>

namespace {

// Сигнал останавливает HTTP-сервер; outbox-диспетчер гасится в деструкторе приложения
inventory::InventoryApp* runningApp = nullptr;

void onShutdownSignal(int signal) {
    std::cout << "\n[main] Signal " << signal << ", stopping inventory service" << std::endl;
    if (runningApp) {
        runningApp->stop();
    }
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        inventory::InventoryApp app;
        runningApp = &app;

        std::signal(SIGINT, onShutdownSignal);
        std::signal(SIGTERM, onShutdownSignal);

        std::cout << "[main] Inventory Service v1.0.0" << std::endl;
        app.run(argc, argv);

        runningApp = nullptr;
        std::cout << "[main] Inventory Service stopped" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        runningApp = nullptr;
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
