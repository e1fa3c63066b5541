/**
 * SuperKit - 74HC595 Shift Register Driver
 *
 * Bit-banged 3-wire bus (DS, SH_CP, ST_CP) for one or more daisy-chained
 * 8-bit serial-in/parallel-out shift registers with output latch.
 */

#ifndef SHIFT_REGISTER_DRIVER_HPP
#define SHIFT_REGISTER_DRIVER_HPP

#include <cstdint>
#include <cstddef>
#include <string>

#include "gpio/gpio_line.hpp"

/**
 * ShiftRegisterDriver
 *
 * Bit order is fixed per instance:
 *   MSB_FIRST  bit 7 shifted first, so after latch Qn = bit n
 *   LSB_FIRST  bit 0 shifted first, so after latch Qn = bit (7 - n)
 *
 * All three lines rest low between calls. Outputs are zeroed and the
 * lines released exactly once, by shutdown() or the destructor.
 * Not thread-safe: call from the thread that owns the driver.
 */
class ShiftRegisterDriver {
public:
    enum class BitOrder {
        MSB_FIRST,
        LSB_FIRST
    };

    struct Pins {
        int data = -1;          // DS (SDI)
        int shift_clock = -1;   // SH_CP (SRCLK)
        int latch_clock = -1;   // ST_CP (RCLK)
    };

    ShiftRegisterDriver(GpioBackend &backend, const Pins &pins,
                        BitOrder order = BitOrder::MSB_FIRST,
                        unsigned pulse_us = 1, int chain_length = 1);
    ~ShiftRegisterDriver();

    ShiftRegisterDriver(const ShiftRegisterDriver&) = delete;
    ShiftRegisterDriver& operator=(const ShiftRegisterDriver&) = delete;

    /**
     * Acquire the three output lines and drive them low.
     */
    GpioStatus init();

    /**
     * Shift one byte into the register chain (8 SH_CP pulses).
     * Bytes already shifted move one chip further down the chain.
     * Returns false if the platform rejected a line write.
     */
    bool serialize(uint8_t data);

    /**
     * Shift count bytes so that data[0] lands in the first chip.
     */
    bool serializeChain(const uint8_t *data, size_t count);

    /**
     * Pulse ST_CP to copy the shift register to the outputs.
     */
    bool latch();

    /**
     * Shift zeros through the whole chain and latch.
     */
    bool clear();

    /**
     * Zero outputs, drive all lines low and release them. Best effort,
     * runs once; later calls do nothing.
     */
    void shutdown();

    bool isInitialized() const { return m_initialized; }
    BitOrder bitOrder() const { return m_order; }
    int chainLength() const { return m_chain_length; }

    static uint8_t reverseBits(uint8_t value);

    /**
     * Re-express a pattern authored for one bit order in another.
     */
    static uint8_t convertOrder(uint8_t pattern, BitOrder from, BitOrder to);

    static const char *bitOrderToString(BitOrder order);
    static bool parseBitOrder(const std::string &name, BitOrder &order);

private:
    bool pulse(GpioLine &line);

    GpioBackend &m_backend;
    Pins m_pins;
    BitOrder m_order;
    unsigned m_pulse_us;
    int m_chain_length;

    GpioLine m_data;
    GpioLine m_shift_clock;
    GpioLine m_latch_clock;

    bool m_initialized = false;
};

#endif // SHIFT_REGISTER_DRIVER_HPP
