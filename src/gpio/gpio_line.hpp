#ifndef GPIO_LINE_HPP
#define GPIO_LINE_HPP

#include "gpio_backend.hpp"

/**
 * Status returned by line acquisition and component init().
 */
enum class GpioStatus {
    OK,
    RESOURCE_UNAVAILABLE,        // pin already owned or platform refused it
    NOTIFICATION_SETUP_FAILED,   // edge notification rejected
    IO_ERROR                     // line owned but a read/write failed
};

const char *gpioStatusToString(GpioStatus status);

/**
 * GpioLine - Exclusive handle on one digital line
 *
 * Move-only. The pin is released when the handle is destroyed or
 * release() is called, whichever comes first.
 */
class GpioLine {
public:
    enum class Mode {
        INPUT,
        INPUT_PULLUP,
        OUTPUT
    };

    GpioLine() = default;
    ~GpioLine();

    GpioLine(GpioLine&& other) noexcept;
    GpioLine& operator=(GpioLine&& other) noexcept;

    GpioLine(const GpioLine&) = delete;
    GpioLine& operator=(const GpioLine&) = delete;

    /**
     * Configure pin on backend. Output lines start low.
     */
    GpioStatus acquire(GpioBackend &backend, int pin, Mode mode);

    bool setHigh() { return set(1); }
    bool setLow() { return set(0); }
    bool set(int level);

    /**
     * Current level (0/1), or -1 on platform error.
     */
    int read();

    GpioStatus onFallingEdge(GpioBackend::EdgeCallback callback);

    void release();

    bool isValid() const { return m_backend != nullptr; }
    int pin() const { return m_pin; }
    Mode mode() const { return m_mode; }

private:
    GpioBackend *m_backend = nullptr;
    int m_pin = -1;
    Mode m_mode = Mode::INPUT;
};

#endif // GPIO_LINE_HPP
