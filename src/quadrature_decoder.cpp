/**
 * QuadratureDecoder Implementation
 */

#include "quadrature_decoder.hpp"
#include "logger.h"

static const char *TAG = "Encoder";

QuadratureDecoder::QuadratureDecoder(GpioBackend &backend, const Pins &pins,
                                     unsigned poll_interval_ms)
    : m_backend(backend)
    , m_pins(pins)
    , m_poll_interval_ms(poll_interval_ms)
{
}

QuadratureDecoder::~QuadratureDecoder() {
    shutdown();
}

GpioStatus QuadratureDecoder::init() {
    if (m_initialized) return GpioStatus::OK;

    GpioStatus status = m_channel_b.acquire(m_backend, m_pins.channel_b, GpioLine::Mode::INPUT);
    if (status != GpioStatus::OK) {
        LOG_ERROR(TAG, "Failed to get dt pin GPIO%d: %s", m_pins.channel_b, gpioStatusToString(status));
        shutdown();
        return status;
    }

    status = m_channel_a.acquire(m_backend, m_pins.channel_a, GpioLine::Mode::INPUT);
    if (status != GpioStatus::OK) {
        LOG_ERROR(TAG, "Failed to get clk pin GPIO%d: %s", m_pins.channel_a, gpioStatusToString(status));
        shutdown();
        return status;
    }

    status = m_reset.acquire(m_backend, m_pins.reset, GpioLine::Mode::INPUT_PULLUP);
    if (status != GpioStatus::OK) {
        LOG_ERROR(TAG, "Failed to get sw pin GPIO%d: %s", m_pins.reset, gpioStatusToString(status));
        shutdown();
        return status;
    }

    int a = m_channel_a.read();
    if (a < 0) {
        LOG_ERROR(TAG, "Initial clk read failed");
        shutdown();
        return GpioStatus::IO_ERROR;
    }
    m_last_a = a;

    status = m_reset.onFallingEdge([this]() { onResetEdge(); });
    if (status != GpioStatus::OK) {
        LOG_ERROR(TAG, "Failed to arm sw falling edge: %s", gpioStatusToString(status));
        shutdown();
        return status;
    }

    m_initialized = true;
    LOG_INFO(TAG, "Ready: CLK=GPIO%d DT=GPIO%d SW=GPIO%d, poll %u ms",
             m_pins.channel_a, m_pins.channel_b, m_pins.reset, m_poll_interval_ms);
    return GpioStatus::OK;
}

QuadratureDecoder::PollResult QuadratureDecoder::poll() {
    if (!m_initialized) return PollResult::READ_ERROR;

    int curr_a = m_channel_a.read();
    int curr_b = m_channel_b.read();
    if (curr_a < 0 || curr_b < 0) {
        LOG_ERROR(TAG, "Channel read failed");
        return PollResult::READ_ERROR;
    }

    if (curr_a == m_last_a) {
        return PollResult::NO_CHANGE;
    }
    m_last_a = curr_a;

    // Direction comes from B's phase relative to A at the moment A moves
    if (curr_b != curr_a) {
        m_count.fetch_add(1, std::memory_order_seq_cst);
        return PollResult::CLOCKWISE;
    }
    m_count.fetch_sub(1, std::memory_order_seq_cst);
    return PollResult::COUNTER_CLOCKWISE;
}

void QuadratureDecoder::reset() {
    m_count.store(0, std::memory_order_seq_cst);
}

void QuadratureDecoder::onResetEdge() {
    reset();
    LOG_DEBUG(TAG, "Switch pressed, counter reset");
    if (m_reset_cb) {
        m_reset_cb(readCount());
    }
}

void QuadratureDecoder::shutdown() {
    // Reset line first so the edge handler stops before anything else goes
    m_reset.release();
    m_channel_a.release();
    m_channel_b.release();
    m_initialized = false;
}
