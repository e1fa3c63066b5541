/**
 * SuperKit - 7-Segment Hex Counter
 *
 * One common-cathode digit behind a 74HC595. Counts 0-F and the
 * decimal point up, then back down.
 */

#include "../common/app_runtime.hpp"
#include "../../src/display_patterns.hpp"
#include "../../src/logger.h"

static const char *TAG = "11_Segment";

static bool showCode(ShiftRegisterDriver &hc595, uint8_t code, int delay_ms) {
    LOG_INFO(TAG, "code = 0x%02X", code);
    bool ok = hc595.serialize(patternFor(code, hc595.bitOrder()));
    ok = hc595.latch() && ok;
    sleepMs(delay_ms);
    return ok;
}

int main(int argc, char *argv[]) {
    AppOptions options;
    options.accepts_delay = true;
    options.delay_ms = SEGMENT_DELAY_MS;

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
        LOG_INFO(TAG, "forward ...");
        for (size_t i = 0; i < SEGMENT_CODE_COUNT && ok; i++) {
            ok = showCode(hc595, SEGMENT_HEX_CODES[i], options.delay_ms);
        }

        if (shutdownRequested()) break;

        LOG_INFO(TAG, "... reverse");
        for (size_t i = SEGMENT_CODE_COUNT; i > 0 && ok; i--) {
            ok = showCode(hc595, SEGMENT_HEX_CODES[i - 1], options.delay_ms);
        }
        sleepMs(options.delay_ms);
    }

    hc595.shutdown();
    LOG_INFO(TAG, "%s stopped", TAG);
    return ok ? 0 : 1;
}
