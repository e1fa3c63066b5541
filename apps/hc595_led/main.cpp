/**
 * SuperKit - 74HC595 LED Bar
 *
 * Eight LEDs on the outputs of one 74HC595. Cycles through the chase
 * modes forward then in reverse until Ctrl-C.
 */

#include "../common/app_runtime.hpp"
#include "../../src/display_patterns.hpp"
#include "../../src/logger.h"

static const char *TAG = "10_74HC595_LED";

static bool showPattern(ShiftRegisterDriver &hc595, uint8_t code, int delay_ms) {
    bool ok = hc595.serialize(patternFor(code, hc595.bitOrder()));
    ok = hc595.latch() && ok;
    sleepMs(delay_ms);
    return ok;
}

int main(int argc, char *argv[]) {
    AppOptions options;
    options.accepts_delay = true;
    options.delay_ms = LED_BAR_DELAY_MS;

    int rc = parseAppOptions(argc, argv, options);
    if (rc >= 0) return rc;

    ConfigStore config;
    rc = startApp(TAG, options, config);
    if (rc >= 0) return rc;

    std::unique_ptr<GpioBackend> gpio = openGpioBackend(config);
    if (!gpio) return 1;

    ShiftRegisterDriver hc595(*gpio, config.shift_register_pins, config.bit_order,
                              config.pulse_us, config.chain_length);
    if (hc595.init() != GpioStatus::OK) {
        return 1;
    }

    bool ok = true;
    while (ok && !shutdownRequested()) {
        for (size_t mode = 0; mode < LED_BAR_MODE_COUNT && ok; mode++) {
            LOG_INFO(TAG, "mode = %zu", mode);

            LOG_INFO(TAG, "forward ...");
            for (size_t i = 0; i < LED_BAR_STEP_COUNT && ok; i++) {
                ok = showPattern(hc595, LED_BAR_MODES[mode][i], options.delay_ms);
            }

            if (shutdownRequested()) break;
            sleepMs(options.delay_ms);

            LOG_INFO(TAG, "... reverse");
            for (size_t i = LED_BAR_STEP_COUNT; i > 0 && ok; i--) {
                ok = showPattern(hc595, LED_BAR_MODES[mode][i - 1], options.delay_ms);
            }
        }
    }

    hc595.shutdown();
    LOG_INFO(TAG, "%s stopped", TAG);
    return ok ? 0 : 1;
}
