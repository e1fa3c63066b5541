#ifndef CONFIG_STORE_HPP
#define CONFIG_STORE_HPP

#include <string>
#include <cstdint>

#include "shift_register_driver.hpp"
#include "quadrature_decoder.hpp"
#include "../common/superkit_pins.h"

#define SUPERKIT_DEFAULT_CONFIG "/etc/superkit/config.json"

/**
 * ConfigStore - Board wiring and runtime settings
 *
 * Loads from / saves to a JSON file. Keys missing from the file keep
 * their defaults; present keys are validated.
 */
class ConfigStore {
public:
    enum class Status {
        OK,
        NOT_FOUND,
        INVALID
    };

    ConfigStore() = default;

    /**
     * Load configuration from file.
     */
    Status load(const std::string &path);

    /**
     * Parse configuration from a JSON document.
     */
    Status parseJson(const std::string &content);

    /**
     * Save configuration to file.
     */
    bool save(const std::string &path) const;

    /**
     * Current configuration as pretty-printed JSON.
     */
    std::string dump() const;

    const std::string &lastError() const { return m_error; }

    // Logging
    std::string log_level = "info";
    std::string log_file;

    // Offset from header GPIO number to kernel line number
    int gpio_base = 0;

    // 74HC595
    ShiftRegisterDriver::Pins shift_register_pins = {HC595_PIN_SDI, HC595_PIN_SRCLK, HC595_PIN_RCLK};
    ShiftRegisterDriver::BitOrder bit_order = ShiftRegisterDriver::BitOrder::MSB_FIRST;
    unsigned pulse_us = HC595_PULSE_US;
    int chain_length = 1;

    // Rotary encoder
    QuadratureDecoder::Pins encoder_pins = {ENCODER_PIN_CLK, ENCODER_PIN_DT, ENCODER_PIN_SW};
    unsigned poll_interval_ms = ENCODER_POLL_MS;

    // Dice
    int dice_button_pin = DICE_PIN_BUTTON;

private:
    Status fail(const std::string &message);

    std::string m_error;
};

#endif // CONFIG_STORE_HPP
