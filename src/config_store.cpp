/**
 * ConfigStore Implementation
 *
 * Uses nlohmann/json for parsing and writing.
 */

#include "config_store.hpp"
#include "logger.h"

#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static const char *TAG = "Config";

ConfigStore::Status ConfigStore::fail(const std::string &message) {
    m_error = message;
    LOG_ERROR(TAG, "%s", message.c_str());
    return Status::INVALID;
}

ConfigStore::Status ConfigStore::load(const std::string &path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        m_error = "cannot open " + path;
        return Status::NOT_FOUND;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    Status status = parseJson(buffer.str());
    if (status == Status::OK) {
        LOG_INFO(TAG, "Loaded from %s", path.c_str());
    }
    return status;
}

ConfigStore::Status ConfigStore::parseJson(const std::string &content) {
    // Parse into a copy so a bad file leaves the current settings intact
    ConfigStore next = *this;

    try {
        json root = json::parse(content);
        if (!root.is_object()) {
            return fail("top level must be an object");
        }

        next.log_level = root.value("log_level", next.log_level);
        next.log_file = root.value("log_file", next.log_file);
        next.gpio_base = root.value("gpio_base", next.gpio_base);

        if (root.contains("shift_register")) {
            const json &sr = root["shift_register"];
            next.shift_register_pins.data = sr.value("data_pin", next.shift_register_pins.data);
            next.shift_register_pins.latch_clock = sr.value("latch_pin", next.shift_register_pins.latch_clock);
            next.shift_register_pins.shift_clock = sr.value("shift_clock_pin", next.shift_register_pins.shift_clock);
            int pulse = sr.value("pulse_us", static_cast<int>(next.pulse_us));
            if (pulse <= 0) {
                return fail("pulse_us must be positive");
            }
            next.pulse_us = static_cast<unsigned>(pulse);
            next.chain_length = sr.value("chain_length", next.chain_length);

            if (sr.contains("bit_order")) {
                std::string order = sr["bit_order"].get<std::string>();
                if (!ShiftRegisterDriver::parseBitOrder(order, next.bit_order)) {
                    return fail("unknown bit_order '" + order + "'");
                }
            }
        }

        if (root.contains("rotary_encoder")) {
            const json &enc = root["rotary_encoder"];
            next.encoder_pins.channel_a = enc.value("clk_pin", next.encoder_pins.channel_a);
            next.encoder_pins.channel_b = enc.value("dt_pin", next.encoder_pins.channel_b);
            next.encoder_pins.reset = enc.value("sw_pin", next.encoder_pins.reset);
            int interval = enc.value("poll_interval_ms", static_cast<int>(next.poll_interval_ms));
            if (interval <= 0) {
                return fail("poll_interval_ms must be positive");
            }
            next.poll_interval_ms = static_cast<unsigned>(interval);
        }

        if (root.contains("dice")) {
            next.dice_button_pin = root["dice"].value("button_pin", next.dice_button_pin);
        }
    } catch (const json::exception &e) {
        return fail(std::string("parse error: ") + e.what());
    }

    LogLevel level;
    if (!Logger::parseLevel(next.log_level, level)) {
        return fail("unknown log_level '" + next.log_level + "'");
    }
    if (next.gpio_base < 0) {
        return fail("gpio_base must not be negative");
    }
    if (next.shift_register_pins.data < 0 || next.shift_register_pins.shift_clock < 0 ||
        next.shift_register_pins.latch_clock < 0) {
        return fail("shift_register pins must not be negative");
    }
    if (next.chain_length < 1 || next.chain_length > HC595_CHAIN_MAX) {
        return fail("chain_length out of range");
    }
    if (next.encoder_pins.channel_a < 0 || next.encoder_pins.channel_b < 0 ||
        next.encoder_pins.reset < 0) {
        return fail("rotary_encoder pins must not be negative");
    }
    if (next.dice_button_pin < 0) {
        return fail("dice button_pin must not be negative");
    }

    next.m_error.clear();
    *this = next;
    return Status::OK;
}

std::string ConfigStore::dump() const {
    json root;
    root["log_level"] = log_level;
    root["log_file"] = log_file;
    root["gpio_base"] = gpio_base;
    root["shift_register"] = {
        {"data_pin", shift_register_pins.data},
        {"latch_pin", shift_register_pins.latch_clock},
        {"shift_clock_pin", shift_register_pins.shift_clock},
        {"bit_order", ShiftRegisterDriver::bitOrderToString(bit_order)},
        {"pulse_us", pulse_us},
        {"chain_length", chain_length},
    };
    root["rotary_encoder"] = {
        {"clk_pin", encoder_pins.channel_a},
        {"dt_pin", encoder_pins.channel_b},
        {"sw_pin", encoder_pins.reset},
        {"poll_interval_ms", poll_interval_ms},
    };
    root["dice"] = {
        {"button_pin", dice_button_pin},
    };
    return root.dump(2);
}

bool ConfigStore::save(const std::string &path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        LOG_ERROR(TAG, "Cannot write %s", path.c_str());
        return false;
    }

    file << dump() << "\n";
    return file.good();
}
