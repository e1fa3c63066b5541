/**
 * SuperKit - 7-Segment Dice
 *
 * Flashes faces 1-6 on a 74HC595 digit. Pressing the button (active low)
 * freezes a random face for two seconds.
 */

#include <random>

#include "../common/app_runtime.hpp"
#include "../../src/display_patterns.hpp"
#include "../../src/logger.h"

static const char *TAG = "11_Dice";

static bool showFace(ShiftRegisterDriver &hc595, size_t face) {
    bool ok = hc595.serialize(patternFor(DICE_FACE_CODES[face], hc595.bitOrder()));
    return hc595.latch() && ok;
}

int main(int argc, char *argv[]) {
    AppOptions options;

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

    GpioLine button;
    GpioStatus status = button.acquire(*gpio, config.dice_button_pin, GpioLine::Mode::INPUT_PULLUP);
    if (status != GpioStatus::OK) {
        LOG_ERROR(TAG, "Failed to get button pin GPIO%d: %s", config.dice_button_pin,
                  gpioStatusToString(status));
        return 1;
    }

    std::random_device seed;
    std::mt19937 rng(seed());
    std::uniform_int_distribution<size_t> roll(0, DICE_FACE_COUNT - 1);

    LOG_INFO(TAG, "Press button to roll ...");

    bool ok = true;
    while (ok && !shutdownRequested()) {
        for (size_t face = 0; face < DICE_FACE_COUNT && ok && !shutdownRequested(); face++) {
            ok = showFace(hc595, face);

            int level = button.read();
            if (level < 0) {
                LOG_ERROR(TAG, "Button read failed");
                ok = false;
            } else if (level == 0) {
                size_t num = roll(rng);
                ok = showFace(hc595, num) && ok;
                LOG_INFO(TAG, "number = %zu", num + 1);
                sleepMs(DICE_HOLD_MS);
            } else {
                sleepMs(DICE_FLASH_MS);
            }
        }
    }

    hc595.shutdown();
    LOG_INFO(TAG, "%s stopped", TAG);
    return ok ? 0 : 1;
}
