#include "app_runtime.hpp"
#include "../../src/logger.h"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <getopt.h>
#include <unistd.h>

#define DEVICE_TREE_MODEL "/proc/device-tree/model"
#define SLEEP_SLICE_MS    10

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int sig) {
    (void)sig;
    g_shutdown.store(true);
}

static void printUsage(const char *progname, bool accepts_delay) {
    std::cout << "Usage: " << progname << " [OPTIONS]\n"
              << "Options:\n"
              << "  -c, --config PATH   Config file (default " SUPERKIT_DEFAULT_CONFIG ")\n";
    if (accepts_delay) {
        std::cout << "  -d, --delay-ms N    Step delay in milliseconds\n";
    }
    std::cout << "  -v, --verbose       Debug logging\n"
              << "  -p, --print-config  Print effective config and exit\n"
              << "  -h, --help          Show this help\n";
}

int parseAppOptions(int argc, char *argv[], AppOptions &options) {
    static struct option long_options[] = {
        {"config",       required_argument, 0, 'c'},
        {"delay-ms",     required_argument, 0, 'd'},
        {"verbose",      no_argument,       0, 'v'},
        {"print-config", no_argument,       0, 'p'},
        {"help",         no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "c:d:vph", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'c':
                options.config_path = optarg;
                break;
            case 'd': {
                if (!options.accepts_delay) {
                    printUsage(argv[0], options.accepts_delay);
                    return 1;
                }
                char *end = nullptr;
                long value = strtol(optarg, &end, 10);
                if (end == optarg || *end != '\0' || value <= 0 || value > 60000) {
                    std::cerr << "Invalid --delay-ms: " << optarg << std::endl;
                    return 1;
                }
                options.delay_ms = static_cast<int>(value);
                break;
            }
            case 'v':
                options.verbose = true;
                break;
            case 'p':
                options.print_config = true;
                break;
            case 'h':
                printUsage(argv[0], options.accepts_delay);
                return 0;
            default:
                printUsage(argv[0], options.accepts_delay);
                return 1;
        }
    }

    return -1;
}

int startApp(const char *name, const AppOptions &options, ConfigStore &config) {
    ConfigStore::Status status = config.load(options.config_path);
    if (status == ConfigStore::Status::NOT_FOUND) {
        LOG_WARN(name, "Config %s not found, using defaults", options.config_path.c_str());
    } else if (status == ConfigStore::Status::INVALID) {
        LOG_ERROR(name, "Bad config %s: %s", options.config_path.c_str(), config.lastError().c_str());
        return 1;
    }

    if (options.print_config) {
        std::cout << config.dump() << std::endl;
        return 0;
    }

    LogLevel level;
    if (!Logger::parseLevel(config.log_level, level)) {
        level = LogLevel::INFO;
    }
    if (options.verbose) {
        level = LogLevel::DEBUG;
    }
    Logger::instance().setLevel(level);

    if (!config.log_file.empty() && !Logger::instance().openFile(config.log_file)) {
        LOG_WARN(name, "Logging to console only");
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    LOG_INFO(name, "%s started on a %s", name, boardModel().c_str());
    return -1;
}

std::unique_ptr<GpioBackend> openGpioBackend(const ConfigStore &config) {
    std::unique_ptr<GpioBackend> gpio(createGpioBackend(config.gpio_base));
    if (!gpio->init()) {
        LOG_ERROR("GPIO", "Failed to initialize GPIO backend");
        return nullptr;
    }
    return gpio;
}

bool shutdownRequested() {
    return g_shutdown.load();
}

void requestShutdown() {
    g_shutdown.store(true);
}

bool sleepMs(unsigned ms) {
    while (ms > 0) {
        if (g_shutdown.load()) return false;
        unsigned slice = ms < SLEEP_SLICE_MS ? ms : SLEEP_SLICE_MS;
        usleep(slice * 1000);
        ms -= slice;
    }
    return !g_shutdown.load();
}

std::string boardModel() {
    std::ifstream file(DEVICE_TREE_MODEL);
    std::string model;
    if (!file.is_open() || !std::getline(file, model, '\0') || model.empty()) {
        return "unknown board";
    }
    return model;
}
