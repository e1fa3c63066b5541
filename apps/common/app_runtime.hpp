/**
 * SuperKit - Demo program plumbing
 *
 * Command line, config loading, logging setup and Ctrl-C handling shared
 * by every demo in apps/.
 */

#ifndef APP_RUNTIME_HPP
#define APP_RUNTIME_HPP

#include <string>
#include <memory>

#include "../../src/config_store.hpp"
#include "../../src/gpio/gpio_backend.hpp"

struct AppOptions {
    std::string config_path = SUPERKIT_DEFAULT_CONFIG;
    bool verbose = false;
    bool print_config = false;
    bool accepts_delay = false;
    int delay_ms = 0;
};

/**
 * Parse argv. Returns -1 to keep running, otherwise the exit code.
 */
int parseAppOptions(int argc, char *argv[], AppOptions &options);

/**
 * Load config, configure the logger, install SIGINT/SIGTERM handlers
 * and log the board model. Returns -1 to keep running, otherwise the
 * exit code.
 */
int startApp(const char *name, const AppOptions &options, ConfigStore &config);

/**
 * Create and initialize the sysfs backend for the configured board.
 */
std::unique_ptr<GpioBackend> openGpioBackend(const ConfigStore &config);

bool shutdownRequested();

/**
 * Ask every loop to stop, as SIGINT/SIGTERM do.
 */
void requestShutdown();

/**
 * Sleep up to ms, waking early once shutdown is requested. Returns
 * false if it woke early.
 */
bool sleepMs(unsigned ms);

/**
 * Board model from the device tree, or "unknown board".
 */
std::string boardModel();

#endif // APP_RUNTIME_HPP
