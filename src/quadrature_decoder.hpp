/**
 * SuperKit - Quadrature Rotary Encoder Decoder
 *
 * Polls CLK (A) and DT (B) at a fixed cadence and keeps a signed detent
 * count. The push switch (SW, active low) zeroes the count from its
 * falling-edge notification.
 */

#ifndef QUADRATURE_DECODER_HPP
#define QUADRATURE_DECODER_HPP

#include <cstdint>
#include <atomic>
#include <functional>

#include "gpio/gpio_line.hpp"

class QuadratureDecoder {
public:
    enum class PollResult {
        NO_CHANGE,
        CLOCKWISE,
        COUNTER_CLOCKWISE,
        READ_ERROR
    };

    struct Pins {
        int channel_a = -1;   // CLK
        int channel_b = -1;   // DT
        int reset = -1;       // SW
    };

    // Called on the notification thread after the switch zeroed the count
    using ResetCallback = std::function<void(int32_t count)>;

    QuadratureDecoder(GpioBackend &backend, const Pins &pins, unsigned poll_interval_ms = 10);
    ~QuadratureDecoder();

    QuadratureDecoder(const QuadratureDecoder&) = delete;
    QuadratureDecoder& operator=(const QuadratureDecoder&) = delete;

    /**
     * Acquire lines, sample the initial A level and arm the reset edge.
     */
    GpioStatus init();

    /**
     * One polling step. Must not run concurrently with itself.
     *
     * A transition on A moves the count by one: +1 when B differs from
     * the new A level, -1 when it matches.
     */
    PollResult poll();

    int32_t readCount() const { return m_count.load(std::memory_order_seq_cst); }

    void reset();

    /**
     * Set before init(); the callback is not replaced while armed.
     */
    void setResetCallback(ResetCallback cb) { m_reset_cb = cb; }

    unsigned pollIntervalMs() const { return m_poll_interval_ms; }
    bool isInitialized() const { return m_initialized; }

    /**
     * Release all lines. No reset notification runs after this returns.
     */
    void shutdown();

private:
    void onResetEdge();

    GpioBackend &m_backend;
    Pins m_pins;
    unsigned m_poll_interval_ms;

    GpioLine m_channel_a;
    GpioLine m_channel_b;
    GpioLine m_reset;

    std::atomic<int32_t> m_count{0};
    int m_last_a = 0;
    ResetCallback m_reset_cb;
    bool m_initialized = false;
};

#endif // QUADRATURE_DECODER_HPP
