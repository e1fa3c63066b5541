/**
 * SuperKit - Rotary Encoder
 *
 * Prints the detent counter whenever the knob turns. Pressing the knob
 * zeroes it.
 */

#include "../common/app_runtime.hpp"
#include "../../src/quadrature_decoder.hpp"
#include "../../src/logger.h"

static const char *TAG = "08_RotaryEncoder";

int main(int argc, char *argv[]) {
    AppOptions options;

    int rc = parseAppOptions(argc, argv, options);
    if (rc >= 0) return rc;

    ConfigStore config;
    rc = startApp(TAG, options, config);
    if (rc >= 0) return rc;

    std::unique_ptr<GpioBackend> gpio = openGpioBackend(config);
    if (!gpio) return 1;

    QuadratureDecoder encoder(*gpio, config.encoder_pins, config.poll_interval_ms);
    encoder.setResetCallback([](int32_t count) {
        LOG_INFO(TAG, "counter = %d", count);
    });
    if (encoder.init() != GpioStatus::OK) {
        return 1;
    }

    LOG_INFO(TAG, "counter = %d", encoder.readCount());

    bool ok = true;
    while (!shutdownRequested()) {
        QuadratureDecoder::PollResult result = encoder.poll();
        if (result == QuadratureDecoder::PollResult::READ_ERROR) {
            ok = false;
            break;
        }
        if (result != QuadratureDecoder::PollResult::NO_CHANGE) {
            LOG_INFO(TAG, "counter = %d", encoder.readCount());
        }
        sleepMs(encoder.pollIntervalMs());
    }

    encoder.shutdown();
    LOG_INFO(TAG, "%s stopped", TAG);
    return ok ? 0 : 1;
}
