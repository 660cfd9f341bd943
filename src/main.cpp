#include "backup.hpp"
#include "backup_api.hpp"
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace {

volatile std::sig_atomic_t gShutdownFlag = 0;

void signalHandler(int /*sig*/) {
    gShutdownFlag = 1;
}

void installSignalHandlers() {
#ifdef _WIN32
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);
#else
    struct sigaction sa {};
    sa.sa_handler = signalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
#endif
}

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [--config <path>] [--daemon] [run|status]" << std::endl;
}

int runDaemon(Backup& backup) {
    installSignalHandlers();
    auto started = backup.start();
    if (!started) {
        std::cerr << "Error: " << started.error().message << std::endl;
        return 1;
    }
    std::cout << "Daemon mode started, press Ctrl+C to stop." << std::endl;
    while (!gShutdownFlag) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    backup.stop();
    backup.getConfig().logMessage("Daemon shutting down gracefully");
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    bool daemonMode = false;
    std::string command;
    std::string configFile = "autobackup_config.json";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--daemon") {
            daemonMode = true;
        } else if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        } else if ((arg == "run" || arg == "status") && command.empty()) {
            command = arg;
        } else {
            printUsage(argv[0]);
            return 1;
        }
    }

    if (!daemonMode && command.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        Backup backup(configFile);

        // The local operator is the administrator.
        if (command == "run") {
            auto outcome = backup.triggerManual(true);
            std::cout << BackupAPI::formatOutcome(outcome) << std::endl;
            if (!outcome) {
                return 1;
            }
        } else if (command == "status") {
            std::cout << BackupAPI::status(backup) << std::endl;
        }

        if (daemonMode) {
            return runDaemon(backup);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
