#include "HostLinkApp.hpp"

#include <csignal>
#include <iostream>

namespace {

HostLinkApp* runningApp = nullptr;

void onTerminate(int signal)
{
    std::cout << "\n[main] Signal " << signal << ", stopping HTTP server" << std::endl;
    if (runningApp != nullptr) {
        runningApp->stop();
    }
}

} // namespace

int main(int argc, char* argv[])
{
    // запись в закрытый клиентом сокет не должна убивать процесс
    std::signal(SIGPIPE, SIG_IGN);

    try {
        HostLinkApp app;
        runningApp = &app;
        std::signal(SIGINT, onTerminate);
        std::signal(SIGTERM, onTerminate);

        std::cout << "[main] hostlink-service " << HOSTLINK_VERSION << ", Ctrl+C to stop" << std::endl;

        // loadEnvironment -> configureInjection -> start, блокирует до stop()
        app.run(argc, argv);

        runningApp = nullptr;
        app.shutdown();
        std::cout << "[main] hostlink-service stopped" << std::endl;
    } catch (const std::exception& e) {
        runningApp = nullptr;
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
