/**
 * ShiftRegisterDriver Implementation
 */

#include "shift_register_driver.hpp"
#include "logger.h"

#include <unistd.h>

static const char *TAG = "HC595";

static const uint8_t MSB_FIRST_MASKS[8] = {0x80, 0x40, 0x20, 0x10, 0x08, 0x04, 0x02, 0x01};
static const uint8_t LSB_FIRST_MASKS[8] = {0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0x40, 0x80};

ShiftRegisterDriver::ShiftRegisterDriver(GpioBackend &backend, const Pins &pins,
                                         BitOrder order, unsigned pulse_us,
                                         int chain_length)
    : m_backend(backend)
    , m_pins(pins)
    , m_order(order)
    , m_pulse_us(pulse_us)
    , m_chain_length(chain_length > 0 ? chain_length : 1)
{
}

ShiftRegisterDriver::~ShiftRegisterDriver() {
    shutdown();
}

GpioStatus ShiftRegisterDriver::init() {
    if (m_initialized) return GpioStatus::OK;

    GpioStatus status = m_data.acquire(m_backend, m_pins.data, GpioLine::Mode::OUTPUT);
    if (status != GpioStatus::OK) {
        LOG_ERROR(TAG, "Failed to get data pin GPIO%d: %s", m_pins.data, gpioStatusToString(status));
        return status;
    }

    status = m_latch_clock.acquire(m_backend, m_pins.latch_clock, GpioLine::Mode::OUTPUT);
    if (status != GpioStatus::OK) {
        LOG_ERROR(TAG, "Failed to get latch clock pin GPIO%d: %s", m_pins.latch_clock, gpioStatusToString(status));
        m_data.release();
        return status;
    }

    status = m_shift_clock.acquire(m_backend, m_pins.shift_clock, GpioLine::Mode::OUTPUT);
    if (status != GpioStatus::OK) {
        LOG_ERROR(TAG, "Failed to get shift clock pin GPIO%d: %s", m_pins.shift_clock, gpioStatusToString(status));
        m_latch_clock.release();
        m_data.release();
        return status;
    }

    m_initialized = true;
    LOG_INFO(TAG, "Ready: DS=GPIO%d SH_CP=GPIO%d ST_CP=GPIO%d, %s, %d chip(s)",
             m_pins.data, m_pins.shift_clock, m_pins.latch_clock,
             bitOrderToString(m_order), m_chain_length);
    return GpioStatus::OK;
}

bool ShiftRegisterDriver::pulse(GpioLine &line) {
    // Low is written even if high failed; a clock must not stay asserted
    bool ok = line.setHigh();
    if (m_pulse_us > 0) {
        usleep(m_pulse_us);
    }
    ok = line.setLow() && ok;
    return ok;
}

bool ShiftRegisterDriver::serialize(uint8_t data) {
    if (!m_initialized) return false;

    const uint8_t *masks = (m_order == BitOrder::MSB_FIRST) ? MSB_FIRST_MASKS : LSB_FIRST_MASKS;

    bool ok = true;
    for (int i = 0; i < 8; i++) {
        ok = m_data.set((data & masks[i]) != 0 ? 1 : 0) && ok;
        ok = pulse(m_shift_clock) && ok;
    }

    if (!ok) {
        LOG_ERROR(TAG, "Line write failed while shifting 0x%02X", data);
    }
    return ok;
}

bool ShiftRegisterDriver::serializeChain(const uint8_t *data, size_t count) {
    bool ok = true;
    for (size_t i = count; i > 0; i--) {
        ok = serialize(data[i - 1]) && ok;
    }
    return ok;
}

bool ShiftRegisterDriver::latch() {
    if (!m_initialized) return false;

    if (!pulse(m_latch_clock)) {
        LOG_ERROR(TAG, "Line write failed while latching");
        return false;
    }
    return true;
}

bool ShiftRegisterDriver::clear() {
    bool ok = true;
    for (int i = 0; i < m_chain_length; i++) {
        ok = serialize(0x00) && ok;
    }
    return latch() && ok;
}

void ShiftRegisterDriver::shutdown() {
    if (!m_initialized) return;

    // Every step runs regardless of earlier failures. Clocks are forced
    // low first so a clock left high by a failed write still gets 8 edges.
    bool ok = m_shift_clock.setLow();
    ok = m_latch_clock.setLow() && ok;
    ok = clear() && ok;
    m_initialized = false;

    ok = m_data.setLow() && ok;
    ok = m_latch_clock.setLow() && ok;
    ok = m_shift_clock.setLow() && ok;
    if (!ok) {
        LOG_WARN(TAG, "Outputs may not be fully cleared");
    }

    m_data.release();
    m_latch_clock.release();
    m_shift_clock.release();
    LOG_DEBUG(TAG, "Outputs cleared, lines released");
}

uint8_t ShiftRegisterDriver::reverseBits(uint8_t value) {
    uint8_t result = 0;
    for (int i = 0; i < 8; i++) {
        result = static_cast<uint8_t>((result << 1) | (value & 0x01));
        value >>= 1;
    }
    return result;
}

uint8_t ShiftRegisterDriver::convertOrder(uint8_t pattern, BitOrder from, BitOrder to) {
    return (from == to) ? pattern : reverseBits(pattern);
}

const char *ShiftRegisterDriver::bitOrderToString(BitOrder order) {
    return (order == BitOrder::MSB_FIRST) ? "msb_first" : "lsb_first";
}

bool ShiftRegisterDriver::parseBitOrder(const std::string &name, BitOrder &order) {
    if (name == "msb_first" || name == "MSB_FIRST") {
        order = BitOrder::MSB_FIRST;
        return true;
    }
    if (name == "lsb_first" || name == "LSB_FIRST") {
        order = BitOrder::LSB_FIRST;
        return true;
    }
    return false;
}
