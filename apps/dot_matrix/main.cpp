/**
 * SuperKit - 8x8 Dot Matrix
 *
 * Two chained 74HC595s: the first drives the row anodes, the second the
 * column cathodes. Plays the sweep animation forward and backward.
 */

#include "../common/app_runtime.hpp"
#include "../../src/display_patterns.hpp"
#include "../../src/logger.h"

static const char *TAG = "12_DotMatrix";

static bool showFrame(ShiftRegisterDriver &hc595, size_t frame, int delay_ms) {
    const uint8_t codes[2] = {
        patternFor(DOT_MATRIX_ROWS[frame], hc595.bitOrder()),
        patternFor(DOT_MATRIX_COLUMNS[frame], hc595.bitOrder()),
    };
    bool ok = hc595.serializeChain(codes, 2);
    ok = hc595.latch() && ok;
    sleepMs(delay_ms);
    return ok;
}

int main(int argc, char *argv[]) {
    AppOptions options;
    options.accepts_delay = true;
    options.delay_ms = DOT_MATRIX_DELAY_MS;

    int rc = parseAppOptions(argc, argv, options);
    if (rc >= 0) return rc;

    ConfigStore config;
    rc = startApp(TAG, options, config);
    if (rc >= 0) return rc;

    if (config.chain_length != 2) {
        LOG_WARN(TAG, "chain_length is %d, dot matrix uses 2", config.chain_length);
    }

    std::unique_ptr<GpioBackend> gpio = openGpioBackend(config);
    if (!gpio) return 1;

    ShiftRegisterDriver hc595(*gpio, config.shift_register_pins, config.bit_order,
                              config.pulse_us, 2);
    if (hc595.init() != GpioStatus::OK) {
        return 1;
    }

    bool ok = true;
    while (ok && !shutdownRequested()) {
        LOG_INFO(TAG, "forward ...");
        for (size_t i = 0; i < DOT_MATRIX_FRAME_COUNT && ok; i++) {
            ok = showFrame(hc595, i, options.delay_ms);
        }

        if (shutdownRequested()) break;

        LOG_INFO(TAG, "... reverse");
        for (size_t i = DOT_MATRIX_FRAME_COUNT; i > 0 && ok; i--) {
            ok = showFrame(hc595, i - 1, options.delay_ms);
        }
        sleepMs(options.delay_ms);
    }

    hc595.shutdown();
    LOG_INFO(TAG, "%s stopped", TAG);
    return ok ? 0 : 1;
}
